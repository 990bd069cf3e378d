#pragma once

#include "body.hpp"
#include "http.hpp"
#include "media_type.hpp"
#include "path_pattern.hpp"
#include "result.hpp"

#include <filesystem>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tanto::http {

class request_context;

// A handler either writes to ctx.res() itself and returns an empty value, or
// returns a value for the dispatcher to convert. Returning an error code
// answers with the status mapped by status_for().
using handler_fn = std::function<result<body_value>(request_context&)>;

struct route_options {
    std::vector<media_type> produces; // empty: nothing negotiable
    std::vector<media_type> consumes; // empty: any Content-Type
    std::string name;
};

struct route_definition {
    method verb = method::any;
    path_pattern pattern;
    handler_fn handler;
    std::vector<media_type> produces;
    std::vector<media_type> consumes;
    std::string name;

    [[nodiscard]] bool accepts_method(method m) const noexcept {
        return verb == method::any || verb == m;
    }
};

struct route_match {
    const route_definition* route{nullptr};
    path_params params;
};

struct resolve_result {
    result<route_match> match;
    // Methods of the definitions whose path matched, in registration order.
    // Filled when match holds method_not_allowed.
    std::vector<method> allowed_methods;
};

// Registration order is precedence: resolve() returns the first definition
// whose pattern and method both match, whatever comes later. Register
// specific patterns before general ones. Not synchronized; finish all add()
// calls before dispatching.
class route_registry {
public:
    // Compiles path and appends the definition. Malformed patterns are
    // rejected here, never at request time.
    [[nodiscard]] result<void>
    add(method verb, std::string_view path, handler_fn handler, route_options options = {});

    [[nodiscard]] result<void> get(std::string_view path, handler_fn handler, route_options options = {}) {
        return add(method::get, path, std::move(handler), std::move(options));
    }
    [[nodiscard]] result<void> post(std::string_view path, handler_fn handler, route_options options = {}) {
        return add(method::post, path, std::move(handler), std::move(options));
    }
    [[nodiscard]] result<void> put(std::string_view path, handler_fn handler, route_options options = {}) {
        return add(method::put, path, std::move(handler), std::move(options));
    }
    [[nodiscard]] result<void> del(std::string_view path, handler_fn handler, route_options options = {}) {
        return add(method::del, path, std::move(handler), std::move(options));
    }
    [[nodiscard]] result<void> patch(std::string_view path, handler_fn handler, route_options options = {}) {
        return add(method::patch, path, std::move(handler), std::move(options));
    }
    [[nodiscard]] result<void> any(std::string_view path, handler_fn handler, route_options options = {}) {
        return add(method::any, path, std::move(handler), std::move(options));
    }

    // GET route serving files under root. path must end in "**" or "**?";
    // the matched remainder names the file.
    [[nodiscard]] result<void> assets(std::string_view path, std::filesystem::path root);

    [[nodiscard]] resolve_result resolve(method verb, std::string_view path) const;

    // Definitions whose pattern matches path, whatever their method.
    [[nodiscard]] std::vector<const route_definition*> match_path(std::string_view path) const;

    [[nodiscard]] std::span<const route_definition> routes() const noexcept { return routes_; }
    [[nodiscard]] size_t size() const noexcept { return routes_.size(); }
    [[nodiscard]] bool empty() const noexcept { return routes_.empty(); }

private:
    std::vector<route_definition> routes_;
};

// Value of the Allow header for a 405 answer, e.g. "GET, POST".
std::string allow_header(std::span<const method> methods);

} // namespace tanto::http
