
#include <string>

#include "gtest/gtest.h"
#include "resilient_rest/error.hpp"
#include "resilient_rest/result.hpp"

using resilient_rest::Error;
using resilient_rest::Result;
using resilient_rest::Status;

TEST(ResultTest, OkAndHasValue) {
    auto r = Result<int>::ok(42);
    EXPECT_TRUE(r.has_value());
    EXPECT_FALSE(r.has_error());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST(ResultTest, ErrorFromCodeAndMessage) {
    auto r = Result<int>::err(Error::Code::ConnectionFailed, "refused");
    EXPECT_TRUE(r.has_error());
    EXPECT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "refused");
    EXPECT_EQ(r.error().code, Error::Code::ConnectionFailed);
}

TEST(ResultTest, ValueOrElseReturnsFallback) {
    auto r = Result<std::string>::err(Error{Error::Code::Timeout, "slow"});
    auto val = r.value_or_else([] { return std::string("fallback"); });
    EXPECT_EQ(val, "fallback");
}

TEST(ResultTest, ValueOrReturnsValue) {
    auto r = Result<int>::ok(7);
    EXPECT_EQ(r.value_or(99), 7);
}

TEST(ResultTest, ErrorOrReturnsFallbackOnSuccess) {
    auto r = Result<int>::ok(1);
    Error fallback{Error::Code::Unknown, "fallback"};
    EXPECT_EQ(&r.error_or(fallback), &fallback);
}

TEST(ResultTest, ForwardErrorKeepsCodeAndMessage) {
    auto r = Result<int>::err(Error::Code::InvalidUrl, "bad url");
    auto forwarded = r.forward_error<std::string>();
    ASSERT_TRUE(forwarded.has_error());
    EXPECT_EQ(forwarded.error().code, Error::Code::InvalidUrl);
    EXPECT_EQ(forwarded.error().message, "bad url");
}

TEST(ResultTest, OkStatusHasValue) {
    Status s = resilient_rest::ok_status();
    EXPECT_TRUE(s.has_value());
}

TEST(ErrorTest, CodesHaveNames) {
    EXPECT_STREQ(resilient_rest::to_string(Error::Code::TlsHandshakeFailed),
                 "TlsHandshakeFailed");
    EXPECT_STREQ(resilient_rest::to_string(Error::Code::Cancelled),
                 "Cancelled");
}
