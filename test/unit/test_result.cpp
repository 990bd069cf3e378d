#include "tanto/core/result.hpp"

#include <gtest/gtest.h>
#include <string>
#include <utility>

using namespace tanto;

TEST(Result, HasValueSuccess) {
    result<int> r = 42;
    EXPECT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
}

TEST(Result, HasValueError) {
    result<int> r = std::unexpected(make_error_code(error_code::not_found));
    EXPECT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), make_error_code(error_code::not_found));
}

TEST(Result, AndThenShortCircuit) {
    result<int> r = 5;
    bool second_called = false;

    auto chain = r.and_then([](int) -> result<int> {
                      return std::unexpected(make_error_code(error_code::malformed_body));
                  }).and_then([&second_called](int val) -> result<int> {
        second_called = true;
        return val * 2;
    });

    EXPECT_FALSE(chain.has_value());
    EXPECT_FALSE(second_called);
    EXPECT_EQ(chain.error(), make_error_code(error_code::malformed_body));
}

TEST(Result, OrElseRecovers) {
    result<std::string> r = std::unexpected(make_error_code(error_code::no_converter));

    auto recovered = r.or_else([](std::error_code err) -> result<std::string> {
        if (err == make_error_code(error_code::no_converter)) {
            return std::string("fallback");
        }
        return std::unexpected(err);
    });

    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(*recovered, "fallback");
}

TEST(Result, VoidSpecialization) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = std::unexpected(make_error_code(error_code::io_error));
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error(), make_error_code(error_code::io_error));
}

TEST(ErrorCategory, NameAndMessages) {
    auto ec = make_error_code(error_code::unsupported_media_type);
    EXPECT_STREQ(ec.category().name(), "tanto");
    EXPECT_EQ(ec.message(), "request Content-Type is not consumable by the route");
    EXPECT_EQ(make_error_code(error_code::duplicate_variable).message(),
              "duplicate variable name in route pattern");
    EXPECT_EQ(get_error_category().message(999), "unknown error");
}

TEST(ErrorCategory, ImplicitConversionFromEnum) {
    std::error_code ec = error_code::not_acceptable;
    EXPECT_EQ(ec, make_error_code(error_code::not_acceptable));
}

TEST(StatusFor, MapsFailureCodes) {
    EXPECT_EQ(status_for(make_error_code(error_code::not_found)), 404);
    EXPECT_EQ(status_for(make_error_code(error_code::method_not_allowed)), 405);
    EXPECT_EQ(status_for(make_error_code(error_code::not_acceptable)), 406);
    EXPECT_EQ(status_for(make_error_code(error_code::unsupported_media_type)), 415);
    EXPECT_EQ(status_for(make_error_code(error_code::malformed_body)), 400);
    EXPECT_EQ(status_for(make_error_code(error_code::bad_request)), 400);
    EXPECT_EQ(status_for(make_error_code(error_code::no_converter)), 500);
    EXPECT_EQ(status_for(make_error_code(error_code::io_error)), 500);
    EXPECT_EQ(status_for(std::make_error_code(std::errc::io_error)), 500);
}
