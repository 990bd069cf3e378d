#include "tanto/core/media_type.hpp"

#include <gtest/gtest.h>

using namespace tanto;
using namespace tanto::http;

TEST(MediaType, ParsesTypeSubtypeAndParams) {
    auto mt = media_type::parse("Application/JSON; Charset=UTF-8");
    ASSERT_TRUE(mt.has_value());
    EXPECT_EQ(mt->type(), "application");
    EXPECT_EQ(mt->subtype(), "json");
    EXPECT_EQ(mt->name(), "application/json");
    EXPECT_EQ(mt->charset().value_or(""), "UTF-8");
    EXPECT_DOUBLE_EQ(mt->quality(), 1.0);
    EXPECT_TRUE(mt->is_concrete());
}

TEST(MediaType, ParsesQualityAndQuotedValues) {
    auto mt = media_type::parse("text/html;q=0.8;level=\"1\"");
    ASSERT_TRUE(mt.has_value());
    EXPECT_DOUBLE_EQ(mt->quality(), 0.8);
    EXPECT_EQ(mt->param("level").value_or(""), "1");
}

TEST(MediaType, LoneStarMeansAnything) {
    auto mt = media_type::parse("*");
    ASSERT_TRUE(mt.has_value());
    EXPECT_TRUE(mt->is_wildcard_type());
    EXPECT_TRUE(mt->is_wildcard_subtype());
}

TEST(MediaType, RejectsMalformedInput) {
    for (std::string_view text : {"", "json", "/json", "text/", "*/json", "text/html;q=2",
                                  "text/html;q=abc", "text/html;level"}) {
        EXPECT_FALSE(media_type::parse(text).has_value()) << text;
    }
}

TEST(MediaType, ParseListKeepsOrderAndSkipsBadEntries) {
    auto list = media_type::parse_list("text/html, bogus, application/json;q=0.5, */*;q=0.1");
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0].name(), "text/html");
    EXPECT_EQ(list[1].name(), "application/json");
    EXPECT_DOUBLE_EQ(list[1].quality(), 0.5);
    EXPECT_EQ(list[2].name(), "*/*");
}

TEST(MediaType, ParseListRespectsQuotedCommas) {
    auto list = media_type::parse_list("text/plain;note=\"a,b\", text/html");
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].param("note").value_or(""), "a,b");
}

TEST(MediaType, MatchSpecificity) {
    EXPECT_EQ(media_type::plain().match_specificity(media_type::plain()), 2);
    EXPECT_EQ(media_type::plain().match_specificity(media_type::text_any()), 1);
    EXPECT_EQ(media_type::text_any().match_specificity(media_type::plain()), 1);
    EXPECT_EQ(media_type::all().match_specificity(media_type::json()), 0);
    EXPECT_EQ(media_type::json().match_specificity(media_type::plain()), media_type::no_match);
    EXPECT_EQ(media_type::text_any().match_specificity(media_type::json()), media_type::no_match);
}

TEST(MediaType, MatchesIsSymmetricAndIgnoresParams) {
    auto utf8 = media_type::plain().with_param("charset", "utf-8");
    EXPECT_TRUE(utf8.matches(media_type::plain()));
    EXPECT_TRUE(media_type::plain().matches(utf8));
    EXPECT_TRUE(media_type::all().matches(media_type::octet_stream()));
    EXPECT_FALSE(media_type::html().matches(media_type::json()));
}

TEST(MediaType, EqualityIgnoresQuality) {
    auto a = media_type::parse("text/html;q=0.3");
    auto b = media_type::parse("TEXT/HTML");
    ASSERT_TRUE(a && b);
    EXPECT_TRUE(*a == *b);
    EXPECT_FALSE(*a == media_type::plain());
}

TEST(MediaType, TextLikeClassification) {
    EXPECT_TRUE(media_type::plain().is_text_like());
    EXPECT_TRUE(media_type::css().is_text_like());
    EXPECT_TRUE(media_type::json().is_text_like());
    EXPECT_TRUE(media_type::problem_json().is_text_like());
    EXPECT_TRUE(media_type::javascript().is_text_like());
    EXPECT_FALSE(media_type::octet_stream().is_text_like());
    EXPECT_FALSE(media_type::by_extension("png").is_text_like());
}

TEST(MediaType, ToStringRendersParams) {
    auto mt = media_type::html().with_param("charset", "utf-8");
    EXPECT_EQ(mt.to_string(), "text/html;charset=utf-8");
    EXPECT_EQ(mt.without_params().to_string(), "text/html");
}

TEST(MediaType, LookupByExtensionAndPath) {
    EXPECT_EQ(media_type::by_extension("css").name(), "text/css");
    EXPECT_EQ(media_type::by_extension("JS").name(), "application/javascript");
    EXPECT_EQ(media_type::by_extension("nope").name(), "application/octet-stream");
    EXPECT_EQ(media_type::by_path("/static/site/index.html").name(), "text/html");
    EXPECT_EQ(media_type::by_path("img/logo.png").name(), "image/png");
    EXPECT_EQ(media_type::by_path("Makefile").name(), "application/octet-stream");
    EXPECT_EQ(media_type::by_path("dir.d/file").name(), "application/octet-stream");
    EXPECT_EQ(media_type::by_path("trailing.").name(), "application/octet-stream");
}
