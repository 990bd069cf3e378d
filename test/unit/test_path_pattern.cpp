#include "tanto/core/path_pattern.hpp"

#include <gtest/gtest.h>

using namespace tanto;
using namespace tanto::http;

namespace {

path_pattern compile_ok(std::string_view raw) {
    auto compiled = path_pattern::compile(raw);
    EXPECT_TRUE(compiled.has_value()) << raw;
    return compiled ? std::move(*compiled) : path_pattern{};
}

} // namespace

TEST(PathPattern, RootMatchesOnlyRoot) {
    auto p = compile_ok("/");
    EXPECT_TRUE(p.match("/").has_value());
    EXPECT_TRUE(p.match("").has_value());
    EXPECT_FALSE(p.match("/a").has_value());
}

TEST(PathPattern, LiteralsAreCaseSensitive) {
    auto p = compile_ok("/api/users");
    EXPECT_TRUE(p.match("/api/users").has_value());
    EXPECT_FALSE(p.match("/API/users").has_value());
    EXPECT_FALSE(p.match("/api/users/1").has_value());
    EXPECT_FALSE(p.match("/api").has_value());
}

TEST(PathPattern, EmptySegmentsAreSkipped) {
    auto p = compile_ok("/api//users/");
    EXPECT_TRUE(p.match("/api/users").has_value());
    EXPECT_TRUE(p.match("//api/users//").has_value());
}

TEST(PathPattern, CapturesBraceAndColonVariables) {
    auto p = compile_ok("/users/{id}/posts/:post");
    EXPECT_EQ(p.variable_count(), 2u);

    auto m = p.match("/users/42/posts/hello");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->get("id").value_or(""), "42");
    EXPECT_EQ(m->get("post").value_or(""), "hello");
    EXPECT_FALSE(m->get("missing").has_value());
    EXPECT_FALSE(m->remainder().has_value());
    ASSERT_EQ(m->entries().size(), 2u);
    EXPECT_EQ(m->entries()[0].first, "id");
}

TEST(PathPattern, RegexConstraintMustMatchWholeSegment) {
    auto p = compile_ok("/items/{id:[0-9]+}");
    auto m = p.match("/items/123");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->get("id").value_or(""), "123");

    EXPECT_FALSE(p.match("/items/12a").has_value());
    EXPECT_FALSE(p.match("/items/abc").has_value());
}

TEST(PathPattern, RegexConstraintMayContainBraces) {
    auto p = compile_ok("/year/{y:\\d{4}}");
    EXPECT_TRUE(p.match("/year/2024").has_value());
    EXPECT_FALSE(p.match("/year/24").has_value());
}

TEST(PathPattern, GlobSegments) {
    auto p = compile_ok("/files/*.txt");
    EXPECT_TRUE(p.match("/files/notes.txt").has_value());
    EXPECT_FALSE(p.match("/files/notes.md").has_value());
    EXPECT_FALSE(p.match("/files/a/notes.txt").has_value());

    auto q = compile_ok("/v?/ping");
    EXPECT_TRUE(q.match("/v1/ping").has_value());
    EXPECT_FALSE(q.match("/v10/ping").has_value());
}

TEST(PathPattern, TrailingWildcardCapturesRemainder) {
    auto p = compile_ok("/assets/**");
    EXPECT_TRUE(p.has_remainder());

    auto m = p.match("/assets/js/app.js");
    ASSERT_TRUE(m.has_value());
    ASSERT_TRUE(m->remainder().has_value());
    EXPECT_EQ(*m->remainder(), "js/app.js");

    EXPECT_FALSE(p.match("/assets").has_value());
    EXPECT_FALSE(p.match("/assets/").has_value());
}

TEST(PathPattern, OptionalWildcardAllowsZeroSegments) {
    auto p = compile_ok("/assets/**?");
    auto m = p.match("/assets");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->remainder().value_or("x"), "");

    auto deep = p.match("/assets/a/b");
    ASSERT_TRUE(deep.has_value());
    EXPECT_EQ(deep->remainder().value_or(""), "a/b");
}

TEST(PathPattern, VariablesAndRemainderTogether) {
    auto p = compile_ok("/repos/{owner}/**");
    auto m = p.match("/repos/tanto/src/core/router.cpp");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->get("owner").value_or(""), "tanto");
    EXPECT_EQ(m->remainder().value_or(""), "src/core/router.cpp");
}

TEST(PathPattern, MatchIsIdempotent) {
    auto p = compile_ok("/users/{id:[a-z]+}/**?");
    for (std::string_view path : {"/users/bob", "/users/bob/x/y", "/users/42", "/other"}) {
        auto first = p.match(path);
        auto second = p.match(path);
        EXPECT_TRUE(first == second) << path;
    }
}

TEST(PathPattern, RejectsMalformedPatterns) {
    auto code = [](std::string_view raw) {
        auto compiled = path_pattern::compile(raw);
        return compiled ? std::error_code{} : compiled.error();
    };
    auto malformed = make_error_code(error_code::malformed_pattern);

    EXPECT_EQ(code(""), malformed);
    EXPECT_EQ(code("users"), malformed);
    EXPECT_EQ(code("/users/{id"), malformed);
    EXPECT_EQ(code("/users/id}"), malformed);
    EXPECT_EQ(code("/users/{}"), malformed);
    EXPECT_EQ(code("/users/:"), malformed);
    EXPECT_EQ(code("/users/{id:}"), malformed);
    EXPECT_EQ(code("/users/{id:[0-9}"), malformed);
    EXPECT_EQ(code("/assets/**/x"), malformed);
    EXPECT_EQ(code("/assets/a**"), malformed);
    EXPECT_EQ(code("/users/{a b}"), malformed);
}

TEST(PathPattern, RejectsDuplicateVariables) {
    auto compiled = path_pattern::compile("/a/{id}/b/:id");
    ASSERT_FALSE(compiled.has_value());
    EXPECT_EQ(compiled.error(), make_error_code(error_code::duplicate_variable));
}

TEST(PathPattern, SplitPathDropsEmptySegments) {
    auto parts = path_pattern::split_path("//a/b//c/");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "b");
    EXPECT_EQ(parts[2], "c");
}
