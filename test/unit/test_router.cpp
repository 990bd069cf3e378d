#include "tanto/core/router.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace tanto;
using namespace tanto::http;

namespace {

handler_fn named(std::string name) {
    return [name = std::move(name)](request_context&) -> result<body_value> { return name; };
}

} // namespace

TEST(RouteRegistry, FirstRegisteredMatchWins) {
    route_registry routes;
    ASSERT_TRUE(routes.get("/user/{id}", named("by-id"), {.name = "by-id"}));
    ASSERT_TRUE(routes.get("/user/static", named("static"), {.name = "static"}));

    auto resolved = routes.resolve(method::get, "/user/static");
    ASSERT_TRUE(resolved.match.has_value());
    EXPECT_EQ(resolved.match->route->name, "by-id");
    EXPECT_EQ(resolved.match->params.get("id").value_or(""), "static");
}

TEST(RouteRegistry, NotFoundWhenNoPathMatches) {
    route_registry routes;
    ASSERT_TRUE(routes.get("/widgets", named("list")));

    auto resolved = routes.resolve(method::get, "/gadgets");
    ASSERT_FALSE(resolved.match.has_value());
    EXPECT_EQ(resolved.match.error(), make_error_code(error_code::not_found));
    EXPECT_TRUE(resolved.allowed_methods.empty());
}

TEST(RouteRegistry, MethodNotAllowedListsMatchingVerbs) {
    route_registry routes;
    ASSERT_TRUE(routes.get("/widgets", named("list")));

    auto resolved = routes.resolve(method::post, "/widgets");
    ASSERT_FALSE(resolved.match.has_value());
    EXPECT_EQ(resolved.match.error(), make_error_code(error_code::method_not_allowed));
    ASSERT_EQ(resolved.allowed_methods.size(), 1u);
    EXPECT_EQ(resolved.allowed_methods[0], method::get);
    EXPECT_EQ(allow_header(resolved.allowed_methods), "GET");
}

TEST(RouteRegistry, AllowedVerbsAreDeduplicatedInRegistrationOrder) {
    route_registry routes;
    ASSERT_TRUE(routes.put("/widgets/{id}", named("replace")));
    ASSERT_TRUE(routes.get("/widgets/{id:[0-9]+}", named("show")));
    ASSERT_TRUE(routes.get("/widgets/:slug", named("show-slug")));
    ASSERT_TRUE(routes.del("/widgets/{id}", named("remove")));

    auto resolved = routes.resolve(method::post, "/widgets/7");
    ASSERT_FALSE(resolved.match.has_value());
    std::vector<method> expected{method::put, method::get, method::del};
    EXPECT_EQ(resolved.allowed_methods, expected);
    EXPECT_EQ(allow_header(resolved.allowed_methods), "PUT, GET, DELETE");
}

TEST(RouteRegistry, AnyVerbMatchesEveryMethod) {
    route_registry routes;
    ASSERT_TRUE(routes.any("/echo", named("echo")));

    for (auto m : {method::get, method::post, method::patch, method::unknown}) {
        auto resolved = routes.resolve(m, "/echo");
        EXPECT_TRUE(resolved.match.has_value());
    }
}

TEST(RouteRegistry, VerbOrderDoesNotOverrideRegistrationOrder) {
    route_registry routes;
    ASSERT_TRUE(routes.post("/items", named("create")));
    ASSERT_TRUE(routes.any("/items", named("fallback")));
    ASSERT_TRUE(routes.get("/items", named("list")));

    auto resolved = routes.resolve(method::get, "/items");
    ASSERT_TRUE(resolved.match.has_value());
    EXPECT_EQ(resolved.match->route, &routes.routes()[1]);
}

TEST(RouteRegistry, RejectsMalformedPatternsAtRegistration) {
    route_registry routes;
    auto added = routes.get("/users/{id", named("x"));
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error(), make_error_code(error_code::malformed_pattern));

    auto dup = routes.get("/a/{x}/{x}", named("x"));
    ASSERT_FALSE(dup.has_value());
    EXPECT_EQ(dup.error(), make_error_code(error_code::duplicate_variable));

    EXPECT_TRUE(routes.empty());
}

TEST(RouteRegistry, RejectsEmptyHandler) {
    route_registry routes;
    EXPECT_FALSE(routes.get("/x", handler_fn{}).has_value());
    EXPECT_EQ(routes.size(), 0u);
}

TEST(RouteRegistry, KeepsDeclaredMediaTypes) {
    route_registry routes;
    ASSERT_TRUE(routes.post("/api/items",
                            named("create"),
                            {.produces = {media_type::json()},
                             .consumes = {media_type::json(), media_type::form()},
                             .name = "create-item"}));

    const auto& def = routes.routes()[0];
    EXPECT_EQ(def.verb, method::post);
    EXPECT_EQ(def.pattern.source(), "/api/items");
    ASSERT_EQ(def.produces.size(), 1u);
    EXPECT_EQ(def.produces[0].name(), "application/json");
    EXPECT_EQ(def.consumes.size(), 2u);
    EXPECT_EQ(def.name, "create-item");
}

TEST(RouteRegistry, MatchPathIgnoresMethod) {
    route_registry routes;
    ASSERT_TRUE(routes.get("/docs/**", named("docs")));
    ASSERT_TRUE(routes.post("/docs/{page}", named("edit")));
    ASSERT_TRUE(routes.get("/other", named("other")));

    auto matches = routes.match_path("/docs/intro");
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0]->verb, method::get);
    EXPECT_EQ(matches[1]->verb, method::post);
}

TEST(RouteRegistry, QueryStringIsNotPartOfResolution) {
    route_registry routes;
    ASSERT_TRUE(routes.get("/search", named("search")));

    request req(method::get, "/search?q=tanto#top");
    auto resolved = routes.resolve(req.http_method, req.path());
    EXPECT_TRUE(resolved.match.has_value());
}

TEST(RouteRegistry, AssetRoutesNeedTrailingWildcard) {
    route_registry routes;
    auto bad = routes.assets("/static", ".");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error(), make_error_code(error_code::malformed_pattern));

    ASSERT_TRUE(routes.assets("/static/**", "."));
    ASSERT_EQ(routes.size(), 1u);
    EXPECT_EQ(routes.routes()[0].verb, method::get);
}

TEST(AllowHeader, SkipsPseudoMethods) {
    std::vector<method> methods{method::get, method::any, method::head};
    EXPECT_EQ(allow_header(methods), "GET, HEAD");
    EXPECT_EQ(allow_header(std::vector<method>{}), "");
}
