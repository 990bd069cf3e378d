#include "tanto/core/path_pattern.hpp"

#include <gtest/gtest.h>

using tanto::http::glob_match;

TEST(GlobMatch, LiteralText) {
    EXPECT_TRUE(glob_match("app.js", "app.js"));
    EXPECT_FALSE(glob_match("app.js", "App.js"));
    EXPECT_FALSE(glob_match("app.js", "app.jsx"));
}

TEST(GlobMatch, QuestionMarkIsExactlyOneCharacter) {
    EXPECT_TRUE(glob_match("v?", "v1"));
    EXPECT_FALSE(glob_match("v?", "v"));
    EXPECT_FALSE(glob_match("v?", "v12"));
}

TEST(GlobMatch, StarIsAnyRunIncludingEmpty) {
    EXPECT_TRUE(glob_match("*", ""));
    EXPECT_TRUE(glob_match("*.css", ".css"));
    EXPECT_TRUE(glob_match("*.css", "site.min.css"));
    EXPECT_TRUE(glob_match("a*b*c", "aXXbYYc"));
    EXPECT_FALSE(glob_match("a*b*c", "aXXbYY"));
}

TEST(GlobMatch, Backtracking) {
    EXPECT_TRUE(glob_match("*ab", "aab"));
    EXPECT_TRUE(glob_match("a*?c", "abbc"));
    EXPECT_FALSE(glob_match("a*?c", "ac"));
}
