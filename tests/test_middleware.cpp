#include <gtest/gtest.h>

#include "resilient_rest/middleware.hpp"

using namespace resilient_rest;

namespace {
    UrlComponents url_of(const std::string& s) { return parse_url(s).value(); }
}  // namespace

TEST(MiddlewareTest, BearerReplacesAnyAuthorizationSpelling) {
    RequestSpec req = make_request(HttpMethod::Get, "https://x/a");
    req.headers["authorization"] = "Basic abc";

    BearerAuthInterceptor bearer("t0k");
    bearer.prepare(req, url_of(req.url));

    EXPECT_EQ(req.headers.size(), 1u);
    EXPECT_EQ(find_header(req.headers, "Authorization"), "Bearer t0k");
}

TEST(MiddlewareTest, ApiKeyAsHeader) {
    RequestSpec req = make_request(HttpMethod::Get, "https://x/a");
    ApiKeyInterceptor key("X-Api-Key", "secret");
    key.prepare(req, url_of(req.url));

    EXPECT_EQ(find_header(req.headers, "X-Api-Key"), "secret");
    EXPECT_EQ(req.url, "https://x/a");
}

TEST(MiddlewareTest, ApiKeyAsQueryParameter) {
    RequestSpec req = make_request(HttpMethod::Get, "https://x/a?b=1#frag");
    ApiKeyInterceptor key("api key", "s&t", ApiKeyInterceptor::Location::Query);
    key.prepare(req, url_of(req.url));

    EXPECT_EQ(req.url, "https://x/a?b=1&api%20key=s%26t");
    EXPECT_TRUE(req.headers.empty());
}
