#include "tanto/core/body_converter.hpp"
#include "tanto/core/dispatcher.hpp"
#include "tanto/core/router.hpp"

#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace tanto;
using namespace tanto::http;

// Domain model
struct user {
    int id;
    std::string name;
    std::string email;
};

struct user_dto {
    std::string name;
    std::string email;
};

// Simple in-memory repository
class user_repository {
public:
    user_repository() {
        users_[1] = {1, "Alice", "alice@example.com"};
        users_[2] = {2, "Bob", "bob@example.com"};
        next_id_ = 3;
    }

    std::vector<user> find_all() const {
        std::vector<user> result;
        result.reserve(users_.size());
        for (const auto& [id, u] : users_) {
            result.push_back(u);
        }
        return result;
    }

    std::optional<user> find_by_id(int id) const {
        auto it = users_.find(id);
        if (it == users_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    user create(user_dto dto) {
        int new_id = next_id_++;
        user u{new_id, std::move(dto.name), std::move(dto.email)};
        users_[new_id] = u;
        return u;
    }

    bool remove(int id) { return users_.erase(id) > 0; }

private:
    std::map<int, user> users_;
    int next_id_;
};

void write_user_json(std::ostream& out, const user& u) {
    out << "{\"id\":" << u.id << ",\"name\":\"" << u.name << "\",\"email\":\"" << u.email << "\"}";
}

// Naive field extraction, for demo purposes
std::optional<std::string> json_field(std::string_view body, std::string_view key) {
    std::string needle = "\"" + std::string(key) + "\":\"";
    auto pos = body.find(needle);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    pos += needle.size();
    auto end = body.find('"', pos);
    if (end == std::string_view::npos) {
        return std::nullopt;
    }
    return std::string(body.substr(pos, end - pos));
}

void register_json_converters(body_converter_registry& converters) {
    converters.add(make_converter<user>(
        "user-json", {media_type::json()}, nullptr, [](const user& u, body_writer& w) {
            return w.text([&](std::ostream& out) { write_user_json(out, u); });
        }));

    converters.add(make_converter<std::vector<user>>(
        "users-json",
        {media_type::json()},
        nullptr,
        [](const std::vector<user>& users, body_writer& w) {
            return w.text([&](std::ostream& out) {
                out << "[";
                for (size_t i = 0; i < users.size(); ++i) {
                    if (i > 0) {
                        out << ",";
                    }
                    write_user_json(out, users[i]);
                }
                out << "]";
            });
        }));

    converters.add(make_converter<user_dto>(
        "user-dto-json",
        {media_type::json()},
        [](body_reader& reader) -> result<user_dto> {
            auto text = reader.text();
            if (!text) {
                return std::unexpected(text.error());
            }
            auto name = json_field(*text, "name");
            auto email = json_field(*text, "email");
            if (!name || !email || name->empty() || email->empty()) {
                return std::unexpected(make_error_code(error_code::malformed_body));
            }
            return user_dto{std::move(*name), std::move(*email)};
        },
        nullptr));
}

result<int> parse_id(request_context& ctx) {
    auto raw = ctx.param("id");
    if (!raw) {
        return std::unexpected(make_error_code(error_code::bad_request));
    }
    return std::stoi(std::string(*raw));
}

result<void> register_routes(route_registry& routes, user_repository& repo) {
    route_options json_out{.produces = {media_type::json()}};
    route_options json_in_out{.produces = {media_type::json()}, .consumes = {media_type::json()}};

    auto welcome = [](request_context&) -> result<body_value> {
        return std::string("Welcome to the tanto REST API example");
    };

    auto list_users = [&repo](request_context&) -> result<body_value> { return repo.find_all(); };

    auto show_user = [&repo](request_context& ctx) -> result<body_value> {
        auto id = parse_id(ctx);
        if (!id) {
            return std::unexpected(id.error());
        }
        auto found = repo.find_by_id(*id);
        if (!found) {
            throw http_error(404, "user " + std::to_string(*id) + " does not exist");
        }
        return *found;
    };

    auto create_user = [&repo](request_context& ctx) -> result<body_value> {
        auto created = repo.create(ctx.body<user_dto>());
        ctx.res().set_status(201);
        ctx.res().set_header("Location", "/api/users/" + std::to_string(created.id));
        return created;
    };

    auto delete_user = [&repo](request_context& ctx) -> result<body_value> {
        auto id = parse_id(ctx);
        if (!id) {
            return std::unexpected(id.error());
        }
        if (!repo.remove(*id)) {
            return std::unexpected(make_error_code(error_code::not_found));
        }
        ctx.res().set_status(204);
        return body_value{};
    };

    // Constrained id routes come before anything broader: first registered
    // match wins.
    for (const auto& added : {routes.get("/", welcome),
                              routes.get("/api/users", list_users, json_out),
                              routes.get("/api/users/{id:[0-9]+}", show_user, json_out),
                              routes.post("/api/users", create_user, json_in_out),
                              routes.del("/api/users/{id:[0-9]+}", delete_user)}) {
        if (!added) {
            return added;
        }
    }
    return {};
}

void show(const dispatcher& d, request req) {
    std::cout << method_to_string(req.http_method) << " " << req.uri << "\n";
    response res;
    auto outcome = d.dispatch(req, res);
    std::cout << "  -> " << res.status << " " << res.reason;
    if (auto type = res.headers.get("Content-Type")) {
        std::cout << " [" << *type << "]";
    }
    if (!outcome.ok()) {
        std::cout << " (" << dispatch_stage_to_string(outcome.stage) << ")";
    }
    std::cout << "\n";
    auto body = res.body();
    if (!body.empty()) {
        std::cout << "  " << body << "\n";
    }
}

request make_request(method m, std::string target, std::string_view accept = {}) {
    request req(m, std::move(target));
    if (!accept.empty()) {
        req.headers.add("Accept", accept);
    }
    return req;
}

int main() {
    user_repository repo;

    route_registry routes;
    if (auto registered = register_routes(routes, repo); !registered) {
        std::cerr << "route registration failed: " << registered.error().message() << "\n";
        return 1;
    }

    body_converter_registry converters;
    register_json_converters(converters);

    dispatcher d(routes, converters, dispatcher_config{}.set_name("rest_api"));

    show(d, make_request(method::get, "/"));
    show(d, make_request(method::get, "/api/users", "application/json"));
    show(d, make_request(method::get, "/api/users/1"));
    show(d, make_request(method::get, "/api/users/99"));
    show(d, make_request(method::get, "/api/users/abc"));
    show(d, make_request(method::get, "/api/users", "text/csv"));

    auto create = make_request(method::post, "/api/users", "application/json");
    create.headers.add("Content-Type", "application/json");
    create.set_body(R"({"name":"Carol","email":"carol@example.com"})");
    show(d, std::move(create));

    auto bad = make_request(method::post, "/api/users");
    bad.headers.add("Content-Type", "application/json");
    bad.set_body(R"({"name":""})");
    show(d, std::move(bad));

    auto wrong_type = make_request(method::post, "/api/users");
    wrong_type.headers.add("Content-Type", "text/plain");
    wrong_type.set_body("Carol");
    show(d, std::move(wrong_type));

    show(d, make_request(method::del, "/api/users/2"));
    show(d, make_request(method::patch, "/api/users/1"));

    return 0;
}
