#include "tanto/core/request_context.hpp"

#include "tanto/core/problem.hpp"

namespace tanto::http {

const body_value& request_context::read_body(const value_shape& shape) {
    if (body_) {
        return *body_;
    }

    reading_body_ = true;
    auto type = consumes_ ? *consumes_ : req_.content_type().value_or(media_type::octet_stream());

    auto converter = converters_.select_reader(shape, type);
    if (!converter) {
        throw configuration_error("no body reader for " + shape.name() + " from " +
                                  type.to_string());
    }

    body_reader reader(req_.body.get(), req_.charset().value_or(charset_));
    result<body_value> value = std::unexpected(make_error_code(error_code::malformed_body));
    try {
        value = (*converter)->read(shape, reader);
    } catch (const http_error&) {
        throw;
    } catch (const std::exception& e) {
        throw http_error(400, e.what());
    } catch (...) {
        throw http_error(400, "unreadable request body");
    }
    if (!value) {
        throw http_error(400, value.error().message());
    }

    body_ = std::move(*value);
    reading_body_ = false;
    return *body_;
}

} // namespace tanto::http
