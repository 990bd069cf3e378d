#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tanto {

struct problem_details {
    std::string type = "about:blank";
    std::string title;
    int status = 500;
    std::optional<std::string> detail;
    std::optional<std::string> instance;
    std::map<std::string, std::string> extensions;

    std::string to_json() const;

    static problem_details from_status(int status, std::string_view detail = "");

    static problem_details bad_request(std::string_view detail = "");
    static problem_details unauthorized(std::string_view detail = "");
    static problem_details forbidden(std::string_view detail = "");
    static problem_details not_found(std::string_view detail = "");
    static problem_details method_not_allowed(std::string_view detail = "");
    static problem_details not_acceptable(std::string_view detail = "");
    static problem_details conflict(std::string_view detail = "");
    static problem_details unsupported_media_type(std::string_view detail = "");
    static problem_details unprocessable_entity(std::string_view detail = "");
    static problem_details internal_server_error(std::string_view detail = "");
    static problem_details service_unavailable(std::string_view detail = "");
};

// Reason phrase for a status code, empty for codes without one.
std::string_view reason_phrase(int status) noexcept;

// Thrown by handlers to answer with a specific status.
class http_error : public std::runtime_error {
public:
    explicit http_error(int status, const std::string& detail = "")
        : std::runtime_error(detail.empty() ? std::string(reason_phrase(status)) : detail),
          status_(status), detail_(detail) {}

    [[nodiscard]] int status() const noexcept { return status_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

    [[nodiscard]] problem_details problem() const {
        return problem_details::from_status(status_, detail_);
    }

private:
    int status_;
    std::string detail_;
};

// Wiring defect detected while serving, e.g. no converter for a value.
class configuration_error : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace tanto
