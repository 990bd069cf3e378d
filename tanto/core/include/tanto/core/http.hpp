#pragma once

#include "body.hpp"
#include "http_headers.hpp"
#include "media_type.hpp"
#include "problem.hpp"

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace tanto::http {

enum class method : uint8_t {
    get,
    post,
    put,
    del,
    patch,
    head,
    options,
    trace,
    connect,
    unknown,
    any, // route definitions only: matches every method
};

method parse_method(std::string_view str) noexcept;
std::string_view method_to_string(method m) noexcept;

// An already-parsed request. The transport owns the wire format; the body is
// exposed as a byte stream that is read at most once.
struct request {
    method http_method = method::unknown;
    std::string uri;
    headers_map headers;
    std::unique_ptr<std::istream> body;

    request() = default;
    request(method m, std::string target) : http_method(m), uri(std::move(target)) {}
    request(request&&) noexcept = default;
    request& operator=(request&&) noexcept = default;

    request(const request&) = delete;
    request& operator=(const request&) = delete;

    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const {
        return headers.get(name);
    }

    // Request target without query string or fragment.
    [[nodiscard]] std::string_view path() const noexcept;

    // Replaces the body stream with an in-memory copy of text and sets
    // Content-Length.
    void set_body(std::string text);

    // Transfer-Encoding present, a positive Content-Length, or a body stream
    // with data when no Content-Length was given.
    [[nodiscard]] bool has_body() const;

    // Parsed Content-Type; nullopt when absent or malformed.
    [[nodiscard]] std::optional<media_type> content_type() const;

    // Parsed Accept entries in header order; empty when the header is absent.
    [[nodiscard]] std::vector<media_type> accept() const;

    // Best of types for this request's Accept header, nullopt if none fits.
    [[nodiscard]] std::optional<media_type> accepts(const std::vector<media_type>& types) const;

    [[nodiscard]] std::optional<std::string> charset() const;

    // True for requests sent with X-Requested-With: XMLHttpRequest.
    [[nodiscard]] bool xhr() const;
};

struct response {
    int32_t status = 200;
    std::string reason = "OK";
    headers_map headers;

    // sink == nullptr buffers the body internally, see body().
    explicit response(std::ostream* sink = nullptr) : sink_(sink) {}
    response(response&&) noexcept = default;
    response& operator=(response&&) noexcept = default;
    response(const response&) = delete;
    response& operator=(const response&) = delete;

    void set_header(std::string_view name, std::string_view value) { headers.set(name, value); }

    void set_status(int32_t code) {
        status = code;
        reason = std::string(reason_phrase(code));
    }

    // Byte sink of the response. Requesting it commits the response: status
    // and headers are considered sent from then on.
    std::ostream& stream() {
        committed_ = true;
        return sink_ ? *sink_ : buffer_;
    }

    [[nodiscard]] bool committed() const noexcept { return committed_; }

    // Contents written to the internal buffer.
    [[nodiscard]] std::string body() const { return buffer_.str(); }

    // Hands a typed value to the dispatcher, which picks a body writer for it
    // once the handler returns.
    void send(body_value value) { pending_ = std::move(value); }

    [[nodiscard]] bool has_pending() const noexcept { return !pending_.empty(); }
    body_value take_pending() { return std::exchange(pending_, body_value{}); }

    // Replaces status, headers and body with a problem+json document. Only
    // valid before the response is committed.
    void write_problem(const problem_details& problem);

    static response error(const problem_details& problem);

private:
    std::ostream* sink_ = nullptr;
    std::ostringstream buffer_;
    bool committed_ = false;
    body_value pending_;
};

} // namespace tanto::http
