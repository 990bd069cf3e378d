#pragma once

#include "body_converter.hpp"
#include "http.hpp"
#include "media_type.hpp"
#include "problem.hpp"
#include "request_context.hpp"
#include "result.hpp"
#include "router.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace tanto::http {

enum class app_mode : uint8_t { dev, prod };

struct dispatcher_config {
    std::string name = "tanto";
    std::string charset = "utf-8";
    app_mode mode = app_mode::dev;
    // Puts exception messages into 500 problem details even in prod.
    bool expose_error_details = false;

    dispatcher_config& set_name(std::string value) {
        name = std::move(value);
        return *this;
    }

    dispatcher_config& set_charset(std::string value) {
        charset = std::move(value);
        return *this;
    }

    dispatcher_config& set_mode(app_mode value) {
        mode = value;
        return *this;
    }

    dispatcher_config& set_expose_error_details(bool value) {
        expose_error_details = value;
        return *this;
    }
};

enum class dispatch_stage : uint8_t {
    resolve_route,
    negotiate_consumes,
    negotiate_produces,
    convert_request_body,
    invoke_handler,
    convert_response_body,
    complete,
};

std::string_view dispatch_stage_to_string(dispatch_stage stage) noexcept;

// Stage the request ended in. error is empty when stage is complete.
struct dispatch_result {
    dispatch_stage stage = dispatch_stage::complete;
    std::error_code error;

    [[nodiscard]] bool ok() const noexcept { return stage == dispatch_stage::complete; }
};

// Drives one request through route resolution, content negotiation, body
// conversion and the handler. Every failure becomes a problem+json response;
// dispatch() never lets an exception escape. The registries are borrowed and
// must outlive the dispatcher; both are read-only here, so one dispatcher may
// serve requests from several threads at once as long as the callbacks are
// thread-safe.
class dispatcher {
public:
    using request_callback = std::function<void(const request&, const response&, const dispatch_result&)>;
    using error_callback = std::function<void(const request&, std::string_view)>;

    dispatcher(const route_registry& routes,
               const body_converter_registry& converters,
               dispatcher_config config = {});

    // Called once per request after the response is complete.
    dispatcher& on_request(request_callback callback) {
        on_request_ = std::move(callback);
        return *this;
    }

    // Called for server-side failures: handler exceptions, missing
    // converters, writer failures. Defaults to a line on stderr.
    dispatcher& on_error(error_callback callback) {
        on_error_ = std::move(callback);
        return *this;
    }

    dispatch_result dispatch(request& req, response& res) const;

    // Buffered dispatch, for tests and simple embedders.
    response operator()(request& req) const {
        response res;
        dispatch(req, res);
        return res;
    }

    [[nodiscard]] const dispatcher_config& config() const noexcept { return config_; }

private:
    dispatch_result run(request& req, response& res) const;

    dispatch_result write_value(const request& req,
                                response& res,
                                body_value value,
                                const std::optional<media_type>& negotiated) const;

    dispatch_result fail(const request& req,
                         response& res,
                         dispatch_stage stage,
                         std::error_code error,
                         problem_details problem) const;

    // Last resort once run() itself threw: logs and answers a bare 500.
    dispatch_result abandon(const request& req, response& res, std::string_view message) const;

    void report(const request& req, std::string_view message) const;
    // report() for paths that must not throw, even from a failing on_error.
    void report_quietly(const request& req, std::string_view message) const noexcept;
    [[nodiscard]] bool expose_details() const noexcept {
        return config_.mode == app_mode::dev || config_.expose_error_details;
    }

    const route_registry& routes_;
    const body_converter_registry& converters_;
    dispatcher_config config_;
    request_callback on_request_;
    error_callback on_error_;
};

// Media type a writer is selected against when the route declares nothing
// to negotiate: the Content-Type the handler already set, else the client's
// most preferred Accept entry, else */*.
media_type writer_target(const request& req, const response& res);

} // namespace tanto::http
