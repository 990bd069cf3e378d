#include "tanto/core/body_converter.hpp"

#include <algorithm>
#include <array>
#include <iterator>

namespace tanto::http {

result<std::string> body_reader::text() {
    if (!in_) {
        return std::string();
    }
    std::string out{std::istreambuf_iterator<char>(*in_), std::istreambuf_iterator<char>()};
    if (in_->bad()) {
        return std::unexpected(make_error_code(error_code::io_error));
    }
    return out;
}

result<bytes> body_reader::read_bytes() {
    auto raw = text();
    if (!raw) {
        return std::unexpected(raw.error());
    }
    return bytes(raw->begin(), raw->end());
}

media_type body_writer::content_type() const {
    return negotiated_.is_concrete() ? negotiated_ : fallback_;
}

void body_writer::prefer(const media_type& type) {
    if (type.is_concrete() && type.matches(negotiated_)) {
        fallback_ = type;
    }
}

result<void> body_writer::text(const write_fn& fn) {
    auto type = content_type();
    if (!type.charset() && !charset_.empty()) {
        type = type.with_param("charset", charset_);
    }
    return write(type, fn);
}

result<void> body_writer::bytes(const write_fn& fn) {
    return write(content_type(), fn);
}

result<void> body_writer::write(const media_type& type, const write_fn& fn) {
    if (!res_.committed()) {
        res_.set_header("Content-Type", type.to_string());
        // Length is unknown until the callback has run.
        res_.headers.remove("Content-Length");
    }
    auto& out = res_.stream();
    fn(out);
    out.flush();
    if (!out) {
        return std::unexpected(make_error_code(error_code::io_error));
    }
    return {};
}

int body_converter::specificity_for(const media_type& type) const {
    int best = media_type::no_match;
    for (const auto& declared : types) {
        best = std::max(best, declared.match_specificity(type));
    }
    if (best == media_type::no_match && also_handles && type.is_concrete() && also_handles(type)) {
        return 1;
    }
    return best;
}

media_type body_converter::default_type_for(const media_type& type) const {
    for (const auto& declared : types) {
        if (declared.is_concrete() && declared.matches(type)) {
            return declared;
        }
    }
    if (also_handles && type.is_concrete() && also_handles(type)) {
        return type.without_params();
    }
    return media_type::octet_stream();
}

body_converter_registry::body_converter_registry() {
    fallbacks_.push_back(copy_text_converter());
    fallbacks_.push_back(copy_bytes_converter());
    fallbacks_.push_back(read_text_converter());
    fallbacks_.push_back(read_bytes_converter());
    fallbacks_.push_back(asset_converter());
    fallbacks_.push_back(to_html_converter());
}

body_converter_registry body_converter_registry::without_fallbacks() {
    return body_converter_registry(no_fallbacks_tag{});
}

body_converter_registry& body_converter_registry::add(body_converter converter) {
    user_.push_back(std::move(converter));
    return *this;
}

template <typename Predicate>
result<const body_converter*> body_converter_registry::select(const media_type& type,
                                                              Predicate&& usable) const {
    const body_converter* best = nullptr;
    int best_specificity = media_type::no_match;

    auto consider = [&](const body_converter& c) {
        if (!usable(c)) {
            return;
        }
        int specificity = c.specificity_for(type);
        if (specificity > best_specificity) {
            best = &c;
            best_specificity = specificity;
        }
    };

    for (const auto& c : user_) {
        consider(c);
    }
    for (const auto& c : fallbacks_) {
        consider(c);
    }

    if (!best) {
        return std::unexpected(make_error_code(error_code::no_converter));
    }
    return best;
}

result<const body_converter*>
body_converter_registry::select_reader(const value_shape& target,
                                       const media_type& content_type) const {
    return select(content_type, [&](const body_converter& c) {
        return c.can_read && c.read && c.can_read(target);
    });
}

result<const body_converter*>
body_converter_registry::select_writer(const value_shape& value,
                                       const media_type& negotiated) const {
    return select(negotiated, [&](const body_converter& c) {
        return c.can_write && c.write && c.can_write(value);
    });
}

result<void> copy_stream(std::istream& from, std::ostream& to) {
    std::array<char, 8192> chunk{};
    while (from) {
        from.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        auto n = from.gcount();
        if (n > 0) {
            to.write(chunk.data(), n);
            if (!to) {
                return std::unexpected(make_error_code(error_code::io_error));
            }
        }
    }
    if (from.bad()) {
        return std::unexpected(make_error_code(error_code::io_error));
    }
    return {};
}

std::string escape_html(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&': out.append("&amp;"); break;
        case '<': out.append("&lt;"); break;
        case '>': out.append("&gt;"); break;
        case '"': out.append("&quot;"); break;
        case '\'': out.append("&#39;"); break;
        default: out.push_back(c);
        }
    }
    return out;
}

body_converter copy_text_converter() {
    auto c = make_converter<std::string>(
        "copy_text",
        {media_type::plain(),
         media_type::html(),
         media_type::text_any(),
         media_type::json(),
         media_type::xml(),
         media_type::javascript()},
        nullptr,
        [](const std::string& value, body_writer& writer) {
            return writer.text([&](std::ostream& out) { out << value; });
        });
    // application/hal+json, image/svg+xml and the like.
    c.also_handles = [](const media_type& type) { return type.is_text_like(); };
    return c;
}

body_converter copy_bytes_converter() {
    return make_converter<bytes>(
        "copy_bytes",
        {media_type::octet_stream(), media_type::all()},
        nullptr,
        [](const bytes& value, body_writer& writer) {
            return writer.bytes([&](std::ostream& out) {
                out.write(reinterpret_cast<const char*>(value.data()),
                          static_cast<std::streamsize>(value.size()));
            });
        });
}

body_converter read_text_converter() {
    return make_converter<std::string>(
        "read_text",
        {media_type::all()},
        [](body_reader& reader) { return reader.text(); },
        nullptr);
}

body_converter read_bytes_converter() {
    return make_converter<bytes>(
        "read_bytes",
        {media_type::all()},
        [](body_reader& reader) { return reader.read_bytes(); },
        nullptr);
}

body_converter asset_converter() {
    return make_converter<asset>(
        "asset",
        {media_type::octet_stream(), media_type::all()},
        nullptr,
        [](const asset& value, body_writer& writer) -> result<void> {
            if (!value.open) {
                return std::unexpected(make_error_code(error_code::io_error));
            }
            // Released on every path out of this scope, including throws
            // from the copy.
            std::unique_ptr<std::istream> in = value.open();
            if (!in || !*in) {
                return std::unexpected(make_error_code(error_code::io_error));
            }

            writer.prefer(value.type);
            result<void> copied{};
            auto copy = [&](std::ostream& out) { copied = copy_stream(*in, out); };
            auto written = value.type.is_text_like() ? writer.text(copy) : writer.bytes(copy);
            if (!written) {
                return written;
            }
            return copied;
        });
}

body_converter to_html_converter() {
    body_converter c;
    c.name = "to_html";
    c.types = {media_type::html()};
    c.can_write = [](const value_shape& s) {
        return !s.is<std::string>() && !s.is<bytes>() && !s.is<asset>() && !s.is<void>();
    };
    c.write = [](const body_value& value, body_writer& writer) {
        return writer.text([&](std::ostream& out) {
            out << "<!doctype html>\n<html><body><pre>" << escape_html(value.describe())
                << "</pre></body></html>";
        });
    };
    return c;
}

} // namespace tanto::http
