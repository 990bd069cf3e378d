#pragma once

#include "body.hpp"
#include "body_converter.hpp"
#include "http.hpp"
#include "media_type.hpp"
#include "path_pattern.hpp"
#include "router.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace tanto::http {

// Everything a handler sees for one request. Lives on the dispatching
// thread for the duration of the handler call.
class request_context {
public:
    request_context(request& req,
                    response& res,
                    const route_definition& route,
                    path_params params,
                    std::optional<media_type> produces,
                    std::optional<media_type> consumes,
                    const body_converter_registry& converters,
                    std::string charset)
        : req_(req), res_(res), route_(route), params_(std::move(params)),
          produces_(std::move(produces)), consumes_(std::move(consumes)),
          converters_(converters), charset_(std::move(charset)) {}

    request_context(const request_context&) = delete;
    request_context& operator=(const request_context&) = delete;

    [[nodiscard]] const request& req() const noexcept { return req_; }
    [[nodiscard]] response& res() noexcept { return res_; }
    [[nodiscard]] const route_definition& route() const noexcept { return route_; }

    [[nodiscard]] const path_params& params() const noexcept { return params_; }
    [[nodiscard]] std::optional<std::string_view> param(std::string_view name) const noexcept {
        return params_.get(name);
    }
    [[nodiscard]] const std::optional<std::string>& remainder() const noexcept {
        return params_.remainder();
    }

    // Negotiated response type; nullopt when the route declares none.
    [[nodiscard]] const std::optional<media_type>& produces() const noexcept { return produces_; }
    // Request Content-Type when the request carries a body.
    [[nodiscard]] const std::optional<media_type>& consumes() const noexcept { return consumes_; }

    [[nodiscard]] const std::string& charset() const noexcept { return charset_; }

    // Converts the request body to T on first use. Throws http_error(400) on
    // malformed input and configuration_error when no reader handles T.
    template <typename T> const T& body() {
        const T* typed = read_body(value_shape::of<T>()).template get<T>();
        if (!typed) {
            throw configuration_error("request body was already read as another type");
        }
        return *typed;
    }

    // True while a body conversion is running or after one has failed.
    [[nodiscard]] bool reading_body() const noexcept { return reading_body_; }

private:
    const body_value& read_body(const value_shape& shape);

    request& req_;
    response& res_;
    const route_definition& route_;
    path_params params_;
    std::optional<media_type> produces_;
    std::optional<media_type> consumes_;
    const body_converter_registry& converters_;
    std::string charset_;
    std::optional<body_value> body_;
    bool reading_body_ = false;
};

} // namespace tanto::http
