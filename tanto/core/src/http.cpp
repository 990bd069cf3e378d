#include "tanto/core/http.hpp"
#include "tanto/core/content_negotiation.hpp"

#include <charconv>

namespace tanto::http {

method parse_method(std::string_view str) noexcept {
    if (str == "GET") return method::get;
    if (str == "POST") return method::post;
    if (str == "PUT") return method::put;
    if (str == "DELETE") return method::del;
    if (str == "PATCH") return method::patch;
    if (str == "HEAD") return method::head;
    if (str == "OPTIONS") return method::options;
    if (str == "TRACE") return method::trace;
    if (str == "CONNECT") return method::connect;
    if (str == "*") return method::any;
    return method::unknown;
}

std::string_view method_to_string(method m) noexcept {
    switch (m) {
        case method::get: return "GET";
        case method::post: return "POST";
        case method::put: return "PUT";
        case method::del: return "DELETE";
        case method::patch: return "PATCH";
        case method::head: return "HEAD";
        case method::options: return "OPTIONS";
        case method::trace: return "TRACE";
        case method::connect: return "CONNECT";
        case method::any: return "*";
        default: return "UNKNOWN";
    }
}

std::string_view request::path() const noexcept {
    std::string_view target = uri;
    auto pos = target.find_first_of("?#");
    if (pos != std::string_view::npos) {
        target = target.substr(0, pos);
    }
    return target.empty() ? std::string_view("/") : target;
}

void request::set_body(std::string text) {
    headers.set("Content-Length", std::to_string(text.size()));
    body = std::make_unique<std::istringstream>(std::move(text));
}

bool request::has_body() const {
    if (headers.contains("Transfer-Encoding")) {
        return true;
    }
    if (auto length = header("Content-Length")) {
        unsigned long long n = 0;
        auto [ptr, ec] = std::from_chars(length->data(), length->data() + length->size(), n);
        return ec == std::errc{} && n > 0;
    }
    if (!body) {
        return false;
    }
    return body->peek() != std::char_traits<char>::eof();
}

std::optional<media_type> request::content_type() const {
    auto header_value = header("Content-Type");
    if (!header_value) {
        return std::nullopt;
    }
    auto parsed = media_type::parse(*header_value);
    if (!parsed) {
        return std::nullopt;
    }
    return std::move(*parsed);
}

std::vector<media_type> request::accept() const {
    auto joined = headers.get_joined("Accept");
    if (!joined) {
        return {};
    }
    return media_type::parse_list(*joined);
}

std::optional<media_type> request::accepts(const std::vector<media_type>& types) const {
    auto negotiated = negotiate_produces(accept(), types);
    if (!negotiated) {
        return std::nullopt;
    }
    return std::move(*negotiated);
}

std::optional<std::string> request::charset() const {
    auto type = content_type();
    if (!type || !type->charset()) {
        return std::nullopt;
    }
    return std::string(*type->charset());
}

bool request::xhr() const {
    auto value = header("X-Requested-With");
    return value && ci_equal(*value, "XMLHttpRequest");
}

void response::write_problem(const problem_details& problem) {
    set_status(problem.status);
    if (reason.empty()) {
        reason = problem.title;
    }
    headers.clear();
    auto json = problem.to_json();
    set_header("Content-Type", media_type::problem_json().name());
    set_header("Content-Length", std::to_string(json.size()));
    buffer_.str({});
    stream() << json;
}

response response::error(const problem_details& problem) {
    response res;
    res.write_problem(problem);
    return res;
}

} // namespace tanto::http
