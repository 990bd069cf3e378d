#include "tanto/core/router.hpp"

#include "tanto/core/problem.hpp"
#include "tanto/core/request_context.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>

namespace tanto::http {

namespace {

bool escapes_root(const std::filesystem::path& relative) {
    return std::any_of(relative.begin(), relative.end(), [](const std::filesystem::path& part) {
        return part == "..";
    });
}

} // namespace

result<void>
route_registry::add(method verb, std::string_view path, handler_fn handler, route_options options) {
    auto pattern = path_pattern::compile(path);
    if (!pattern) {
        std::cerr << "[router] rejected pattern \"" << path << "\": " << pattern.error().message()
                  << "\n";
        return std::unexpected(pattern.error());
    }
    if (!handler) {
        std::cerr << "[router] rejected " << method_to_string(verb) << " " << path
                  << ": empty handler\n";
        return std::unexpected(make_error_code(error_code::internal_error));
    }

    route_definition def;
    def.verb = verb;
    def.pattern = std::move(*pattern);
    def.handler = std::move(handler);
    def.produces = std::move(options.produces);
    def.consumes = std::move(options.consumes);
    def.name = std::move(options.name);
    routes_.push_back(std::move(def));
    return {};
}

result<void> route_registry::assets(std::string_view path, std::filesystem::path root) {
    auto pattern = path_pattern::compile(path);
    if (!pattern) {
        std::cerr << "[router] rejected pattern \"" << path << "\": " << pattern.error().message()
                  << "\n";
        return std::unexpected(pattern.error());
    }
    if (!pattern->has_remainder()) {
        std::cerr << "[router] asset route \"" << path << "\" must end in a wildcard\n";
        return std::unexpected(make_error_code(error_code::malformed_pattern));
    }

    handler_fn serve = [root = std::move(root)](request_context& ctx) -> result<body_value> {
        const auto& rest = ctx.remainder();
        std::filesystem::path relative(rest ? *rest : std::string());
        if (relative.empty() || relative.is_absolute() || escapes_root(relative)) {
            throw http_error(404);
        }

        auto file = root / relative;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(file, ec)) {
            throw http_error(404);
        }

        auto resource = asset::from_file(file);
        ctx.res().set_header("Content-Type", resource.type.to_string());
        return body_value(std::move(resource));
    };

    route_options options;
    options.name = "assets:" + std::string(path);
    return add(method::get, path, std::move(serve), std::move(options));
}

resolve_result route_registry::resolve(method verb, std::string_view path) const {
    resolve_result out{std::unexpected(make_error_code(error_code::not_found)), {}};
    bool path_matched = false;

    for (const auto& route : routes_) {
        auto params = route.pattern.match(path);
        if (!params) {
            continue;
        }
        if (route.accepts_method(verb)) {
            out.match = route_match{&route, std::move(*params)};
            out.allowed_methods.clear();
            return out;
        }

        path_matched = true;
        if (std::find(out.allowed_methods.begin(), out.allowed_methods.end(), route.verb) ==
            out.allowed_methods.end()) {
            out.allowed_methods.push_back(route.verb);
        }
    }

    if (path_matched) {
        out.match = std::unexpected(make_error_code(error_code::method_not_allowed));
    }
    return out;
}

std::vector<const route_definition*> route_registry::match_path(std::string_view path) const {
    std::vector<const route_definition*> out;
    for (const auto& route : routes_) {
        if (route.pattern.match(path)) {
            out.push_back(&route);
        }
    }
    return out;
}

std::string allow_header(std::span<const method> methods) {
    std::string allow;
    allow.reserve(32);

    bool first = true;
    for (auto m : methods) {
        if (m == method::any || m == method::unknown) {
            continue;
        }
        if (!first) {
            allow.append(", ");
        }
        allow.append(method_to_string(m));
        first = false;
    }
    return allow;
}

} // namespace tanto::http
