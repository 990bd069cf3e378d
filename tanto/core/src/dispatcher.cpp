#include "tanto/core/dispatcher.hpp"

#include "tanto/core/content_negotiation.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

namespace tanto::http {

namespace {

std::error_code code_for_status(int status) {
    switch (status) {
    case 400:
        return make_error_code(error_code::bad_request);
    case 404:
        return make_error_code(error_code::not_found);
    case 405:
        return make_error_code(error_code::method_not_allowed);
    case 406:
        return make_error_code(error_code::not_acceptable);
    case 415:
        return make_error_code(error_code::unsupported_media_type);
    default:
        return make_error_code(status >= 500 ? error_code::internal_error
                                             : error_code::bad_request);
    }
}

} // namespace

std::string_view dispatch_stage_to_string(dispatch_stage stage) noexcept {
    switch (stage) {
    case dispatch_stage::resolve_route:
        return "resolve_route";
    case dispatch_stage::negotiate_consumes:
        return "negotiate_consumes";
    case dispatch_stage::negotiate_produces:
        return "negotiate_produces";
    case dispatch_stage::convert_request_body:
        return "convert_request_body";
    case dispatch_stage::invoke_handler:
        return "invoke_handler";
    case dispatch_stage::convert_response_body:
        return "convert_response_body";
    case dispatch_stage::complete:
        return "complete";
    }
    return "unknown";
}

media_type writer_target(const request& req, const response& res) {
    if (auto declared = res.headers.get("Content-Type")) {
        if (auto parsed = media_type::parse(*declared)) {
            return std::move(*parsed);
        }
    }

    auto accepted = req.accept();
    // Highest quality first; equal qualities keep header order.
    std::stable_sort(accepted.begin(), accepted.end(), [](const media_type& a, const media_type& b) {
        return a.quality() > b.quality();
    });
    if (!accepted.empty() && accepted.front().quality() > 0.0) {
        return accepted.front().without_params();
    }
    return media_type::all();
}

dispatcher::dispatcher(const route_registry& routes,
                       const body_converter_registry& converters,
                       dispatcher_config config)
    : routes_(routes), converters_(converters), config_(std::move(config)) {}

dispatch_result dispatcher::dispatch(request& req, response& res) const {
    dispatch_result outcome;
    try {
        outcome = run(req, res);
    } catch (const std::exception& e) {
        // Only reachable when building a problem response or reporting failed.
        outcome = abandon(req, res, e.what());
    } catch (...) {
        outcome = abandon(req, res, "unknown exception");
    }

    if (on_request_) {
        try {
            on_request_(req, res, outcome);
        } catch (const std::exception& e) {
            report_quietly(req, std::string("request callback threw: ") + e.what());
        } catch (...) {
            report_quietly(req, "request callback threw an unknown exception");
        }
    }
    return outcome;
}

dispatch_result dispatcher::abandon(const request& req,
                                    response& res,
                                    std::string_view message) const {
    report_quietly(req, message);
    if (!res.committed()) {
        try {
            res.write_problem(problem_details::internal_server_error());
        } catch (...) {
            res.set_status(500);
        }
    }
    return dispatch_result{dispatch_stage::invoke_handler, make_error_code(error_code::internal_error)};
}

dispatch_result dispatcher::run(request& req, response& res) const {
    auto resolved = routes_.resolve(req.http_method, req.path());
    if (!resolved.match) {
        auto ec = resolved.match.error();
        if (ec == make_error_code(error_code::method_not_allowed)) {
            auto out = fail(req, res, dispatch_stage::resolve_route, ec,
                            problem_details::method_not_allowed());
            auto allow = allow_header(resolved.allowed_methods);
            if (!allow.empty()) {
                res.set_header("Allow", allow);
            }
            return out;
        }
        return fail(req, res, dispatch_stage::resolve_route, ec, problem_details::not_found());
    }

    route_match match = std::move(*resolved.match);
    const route_definition& route = *match.route;

    std::optional<media_type> consumed;
    if (req.has_body()) {
        consumed = req.content_type();
        auto accepted = negotiate_consumes(consumed, route.consumes);
        if (!accepted) {
            return fail(req, res, dispatch_stage::negotiate_consumes, accepted.error(),
                        problem_details::unsupported_media_type());
        }
    }

    std::optional<media_type> negotiated;
    if (!route.produces.empty()) {
        auto best = negotiate_produces(req.accept(), route.produces);
        if (!best) {
            return fail(req, res, dispatch_stage::negotiate_produces, best.error(),
                        problem_details::not_acceptable());
        }
        negotiated = std::move(*best);
    }

    request_context ctx(req, res, route, std::move(match.params), negotiated, consumed,
                        converters_, config_.charset);

    auto stage_of = [&ctx] {
        return ctx.reading_body() ? dispatch_stage::convert_request_body
                                  : dispatch_stage::invoke_handler;
    };

    result<body_value> out = body_value{};
    try {
        out = route.handler(ctx);
    } catch (const http_error& e) {
        if (e.status() >= 500) {
            report(req, e.what());
        }
        return fail(req, res, stage_of(), code_for_status(e.status()), e.problem());
    } catch (const configuration_error& e) {
        report(req, e.what());
        return fail(req, res, stage_of(), make_error_code(error_code::no_converter),
                    problem_details::internal_server_error(expose_details() ? e.what() : ""));
    } catch (const std::exception& e) {
        report(req, e.what());
        return fail(req, res, stage_of(), make_error_code(error_code::internal_error),
                    problem_details::internal_server_error(expose_details() ? e.what() : ""));
    } catch (...) {
        report(req, "unknown exception");
        return fail(req, res, stage_of(), make_error_code(error_code::internal_error),
                    problem_details::internal_server_error());
    }

    if (!out) {
        auto ec = out.error();
        int status = status_for(ec);
        if (status >= 500) {
            report(req, ec.message());
        }
        bool show = status < 500 || expose_details();
        return fail(req, res, dispatch_stage::invoke_handler, ec,
                    problem_details::from_status(status, show ? ec.message() : ""));
    }

    body_value value = std::move(*out);
    if (value.empty() && res.has_pending()) {
        value = res.take_pending();
    }
    if (value.empty()) {
        return dispatch_result{};
    }
    return write_value(req, res, std::move(value), negotiated);
}

dispatch_result dispatcher::write_value(const request& req,
                                        response& res,
                                        body_value value,
                                        const std::optional<media_type>& negotiated) const {
    media_type target = negotiated ? *negotiated : writer_target(req, res);

    auto converter = converters_.select_writer(value.shape(), target);
    if (!converter) {
        std::string message = "no body writer for " + value.shape().name() + " as " +
                              target.to_string();
        report(req, message);
        return fail(req, res, dispatch_stage::convert_response_body, converter.error(),
                    problem_details::internal_server_error(expose_details() ? message : ""));
    }

    body_writer writer(res, target, (*converter)->default_type_for(target), config_.charset);
    std::error_code ec;
    std::string message;
    try {
        auto written = (*converter)->write(value, writer);
        if (written) {
            return dispatch_result{};
        }
        ec = written.error();
        message = ec.message();
    } catch (const std::exception& e) {
        ec = make_error_code(error_code::io_error);
        message = e.what();
    } catch (...) {
        ec = make_error_code(error_code::io_error);
        message = "unknown exception";
    }

    report(req, (*converter)->name + " failed: " + message);
    return fail(req, res, dispatch_stage::convert_response_body, ec,
                problem_details::internal_server_error(expose_details() ? message : ""));
}

dispatch_result dispatcher::fail(const request& req,
                                 response& res,
                                 dispatch_stage stage,
                                 std::error_code error,
                                 problem_details problem) const {
    if (res.committed()) {
        // Status and headers are gone; the partial body is all the client gets.
        report(req, "response already committed, abandoning it after " +
                        std::string(dispatch_stage_to_string(stage)) + " failure");
        return dispatch_result{stage, error};
    }

    problem.instance = std::string(req.path());
    res.write_problem(problem);
    return dispatch_result{stage, error};
}

void dispatcher::report(const request& req, std::string_view message) const {
    if (on_error_) {
        on_error_(req, message);
        return;
    }
    std::cerr << "[dispatcher] " << config_.name << " " << method_to_string(req.http_method) << " "
              << req.path() << ": " << message << "\n";
}

void dispatcher::report_quietly(const request& req, std::string_view message) const noexcept {
    try {
        report(req, message);
    } catch (const std::exception& e) {
        std::cerr << "[dispatcher] error callback threw: " << e.what() << "\n";
    } catch (...) {
        std::cerr << "[dispatcher] error callback threw an unknown exception\n";
    }
}

} // namespace tanto::http
