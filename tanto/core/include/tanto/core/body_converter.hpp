#pragma once

#include "body.hpp"
#include "http.hpp"
#include "media_type.hpp"
#include "result.hpp"

#include <functional>
#include <istream>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace tanto::http {

// Read side of a conversion: the request body stream and its charset.
class body_reader {
public:
    body_reader(std::istream* in, std::string charset) : in_(in), charset_(std::move(charset)) {}

    [[nodiscard]] result<std::string> text();
    [[nodiscard]] result<bytes> read_bytes();

    // nullptr when the request carries no stream.
    [[nodiscard]] std::istream* stream() noexcept { return in_; }
    [[nodiscard]] const std::string& charset() const noexcept { return charset_; }

private:
    std::istream* in_;
    std::string charset_;
};

// Write side of a conversion. The Content-Type is the negotiated type when it
// is concrete, otherwise the fallback type. It is set on the response right
// before the first byte.
class body_writer {
public:
    using write_fn = std::function<void(std::ostream&)>;

    body_writer(response& res, media_type negotiated, media_type fallback, std::string charset)
        : res_(res), negotiated_(std::move(negotiated)), fallback_(std::move(fallback)),
          charset_(std::move(charset)) {}

    [[nodiscard]] const media_type& negotiated() const noexcept { return negotiated_; }
    [[nodiscard]] const std::string& charset() const noexcept { return charset_; }
    [[nodiscard]] media_type content_type() const;

    // Uses type as the fallback when it is compatible with the negotiated type.
    void prefer(const media_type& type);

    // Character output: the Content-Type gets a charset parameter if missing.
    [[nodiscard]] result<void> text(const write_fn& fn);
    // Byte output: the Content-Type is left as is.
    [[nodiscard]] result<void> bytes(const write_fn& fn);

private:
    result<void> write(const media_type& type, const write_fn& fn);

    response& res_;
    media_type negotiated_;
    media_type fallback_;
    std::string charset_;
};

// A converter is its media types, two shape predicates and the two
// operations. A missing predicate means the direction is unsupported.
struct body_converter {
    std::string name;
    std::vector<media_type> types;
    // Optional family of concrete types handled beyond the declared list.
    // A type admitted only here scores as a subtype wildcard would.
    std::function<bool(const media_type&)> also_handles;
    std::function<bool(const value_shape&)> can_read;
    std::function<bool(const value_shape&)> can_write;
    std::function<result<body_value>(const value_shape&, body_reader&)> read;
    std::function<result<void>(const body_value&, body_writer&)> write;

    // Best media_type::match_specificity over types, no_match if none.
    [[nodiscard]] int specificity_for(const media_type& type) const;

    // First concrete declared type compatible with type, else octet-stream.
    [[nodiscard]] media_type default_type_for(const media_type& type) const;
};

// Typed converter from two callables; either may be empty.
template <typename T>
body_converter make_converter(std::string name,
                              std::vector<media_type> types,
                              std::function<result<T>(body_reader&)> read,
                              std::function<result<void>(const T&, body_writer&)> write) {
    body_converter c;
    c.name = std::move(name);
    c.types = std::move(types);
    if (read) {
        c.can_read = [](const value_shape& s) { return s.is<T>(); };
        c.read = [read = std::move(read)](const value_shape&,
                                          body_reader& reader) -> result<body_value> {
            auto value = read(reader);
            if (!value) {
                return std::unexpected(value.error());
            }
            return body_value(std::move(*value));
        };
    }
    if (write) {
        c.can_write = [](const value_shape& s) { return s.is<T>(); };
        c.write = [write = std::move(write)](const body_value& value,
                                             body_writer& writer) -> result<void> {
            const T* typed = value.get<T>();
            if (!typed) {
                return std::unexpected(make_error_code(error_code::no_converter));
            }
            return write(*typed, writer);
        };
    }
    return c;
}

// Ordered converter set. User converters are consulted before the built-in
// fallbacks; among candidates the most specific media-type match wins, then
// the earlier registration. Read-only once dispatching starts.
class body_converter_registry {
public:
    // Installs the built-in fallbacks.
    body_converter_registry();

    [[nodiscard]] static body_converter_registry without_fallbacks();

    body_converter_registry& add(body_converter converter);

    [[nodiscard]] result<const body_converter*> select_reader(const value_shape& target,
                                                              const media_type& content_type) const;
    [[nodiscard]] result<const body_converter*> select_writer(const value_shape& value,
                                                              const media_type& negotiated) const;

    [[nodiscard]] std::span<const body_converter> user_converters() const noexcept {
        return user_;
    }
    [[nodiscard]] std::span<const body_converter> fallbacks() const noexcept {
        return fallbacks_;
    }

private:
    struct no_fallbacks_tag {};
    explicit body_converter_registry(no_fallbacks_tag) {}

    template <typename Predicate>
    result<const body_converter*> select(const media_type& type, Predicate&& usable) const;

    std::vector<body_converter> user_;
    std::vector<body_converter> fallbacks_;
};

// Built-in converters, in fallback order.
body_converter copy_text_converter();
body_converter copy_bytes_converter();
body_converter read_text_converter();
body_converter read_bytes_converter();
body_converter asset_converter();
body_converter to_html_converter();

// Copies from into to in fixed-size chunks; io_error when either side fails.
[[nodiscard]] result<void> copy_stream(std::istream& from, std::ostream& to);

std::string escape_html(std::string_view text);

} // namespace tanto::http
