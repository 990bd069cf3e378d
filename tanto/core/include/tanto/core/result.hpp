#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace tanto {

template <typename T> using result = std::expected<T, std::error_code>;

enum class error_code : int {
    ok = 0,
    not_found = 1,
    method_not_allowed = 2,
    not_acceptable = 3,
    unsupported_media_type = 4,
    malformed_pattern = 5,
    duplicate_variable = 6,
    malformed_media_type = 7,
    no_converter = 8,
    malformed_body = 9,
    io_error = 10,
    bad_request = 11,
    internal_error = 12,
};

class error_category : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "tanto"; }

    [[nodiscard]] std::string message(int ev) const override {
        using ec = error_code;
        switch (static_cast<ec>(ev)) {
        case ec::ok:
            return "success";
        case ec::not_found:
            return "no route matches the request path";
        case ec::method_not_allowed:
            return "route does not accept the request method";
        case ec::not_acceptable:
            return "no producible media type satisfies Accept";
        case ec::unsupported_media_type:
            return "request Content-Type is not consumable by the route";
        case ec::malformed_pattern:
            return "malformed route pattern";
        case ec::duplicate_variable:
            return "duplicate variable name in route pattern";
        case ec::malformed_media_type:
            return "malformed media type";
        case ec::no_converter:
            return "no body converter for value and media type";
        case ec::malformed_body:
            return "request body could not be converted";
        case ec::io_error:
            return "body stream failure";
        case ec::bad_request:
            return "bad request";
        case ec::internal_error:
            return "internal error";
        default:
            return "unknown error";
        }
    }
};

inline const error_category& get_error_category() {
    static error_category const instance;
    return instance;
}

inline std::error_code make_error_code(error_code e) {
    return {static_cast<int>(e), get_error_category()};
}

// HTTP status for a failure code; codes from other categories map to 500.
inline int status_for(std::error_code ec) noexcept {
    if (ec.category() != get_error_category()) {
        return 500;
    }
    switch (static_cast<error_code>(ec.value())) {
    case error_code::not_found:
        return 404;
    case error_code::method_not_allowed:
        return 405;
    case error_code::not_acceptable:
        return 406;
    case error_code::unsupported_media_type:
        return 415;
    case error_code::malformed_body:
    case error_code::malformed_media_type:
    case error_code::bad_request:
        return 400;
    default:
        return 500;
    }
}

} // namespace tanto

namespace std {
template <> struct is_error_code_enum<tanto::error_code> : true_type {};
} // namespace std
