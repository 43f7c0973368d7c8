#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <string>

#include "gtest/gtest.h"
#include "resilient_rest/headers.hpp"
#include "resilient_rest/operation_result.hpp"
#include "resilient_rest/exceptions.hpp"
#include "resilient_rest/response.hpp"

using namespace resilient_rest;

TEST(ResponseTest, ParseBeastResponse) {
    namespace http = boost::beast::http;
    http::response<http::string_body> beast_res;
    beast_res.result(http::status::accepted);
    beast_res.set(http::field::server, "test-server");
    beast_res.set(http::field::location, "/status/1");
    beast_res.body() = "{\"foo\":42}";
    beast_res.prepare_payload();

    Response out = parse_beast_response(std::move(beast_res));
    EXPECT_EQ(out.status_code, 202);
    EXPECT_EQ(out.headers["Server"], "test-server");
    EXPECT_EQ(out.header("location").value_or(""), "/status/1");
    EXPECT_EQ(out.body, "{\"foo\":42}");
}

TEST(HeadersTest, FindHeaderIsCaseInsensitive) {
    Headers h{{"Retry-After", "3"}};
    EXPECT_EQ(find_header(h, "retry-after").value_or(""), "3");
    EXPECT_FALSE(find_header(h, "Location").has_value());
}

TEST(HeadersTest, SetHeaderReplacesOtherSpelling) {
    Headers h{{"content-type", "text/plain"}};
    set_header(h, "Content-Type", "application/json");
    ASSERT_EQ(h.size(), 1u);
    EXPECT_EQ(h.at("Content-Type"), "application/json");
}

TEST(HeadersTest, MergeLetsOverridesWin) {
    std::map<std::string, std::string> defaults{{"Accept", "application/json"},
                                                {"X-Team", "core"}};
    Headers merged = merge_headers(defaults, {{"accept", "text/csv"}});
    EXPECT_EQ(merged.size(), 2u);
    EXPECT_EQ(find_header(merged, "Accept").value_or(""), "text/csv");
    EXPECT_EQ(find_header(merged, "X-Team").value_or(""), "core");
}

TEST(HeadersTest, WithIfMatch) {
    Headers h = with_if_match({}, "W/\"3\"");
    EXPECT_EQ(find_header(h, "If-Match").value_or(""), "W/\"3\"");
    EXPECT_TRUE(with_if_match({}, "").empty());
}

TEST(OperationResultTest, JsonOfEmptyPayloadIsEmptyObject) {
    OperationResult r;
    r.success = true;
    EXPECT_TRUE(r.json().is_object());
    EXPECT_TRUE(r.json().empty());
}

TEST(OperationResultTest, JsonParsesPayload) {
    OperationResult r;
    r.payload = R"({"done":true})";
    EXPECT_TRUE(r.json().at("done").get<bool>());
}

TEST(OperationResultTest, MalformedPayloadThrowsOperationError) {
    OperationResult r;
    r.payload = "<html>";
    r.status_code = 200;
    EXPECT_THROW((void)r.json(), OperationError);
}

TEST(OperationResultTest, ThrowEngineErrorMatchesKind) {
    OperationResult r;
    r.error_kind = ErrorKind::RateLimited;
    r.message = "HTTP 429";
    r.attempts = 3;
    r.status_code = 429;
    try {
        throw_engine_error(r);
        FAIL() << "expected RateLimitedError";
    } catch (const RateLimitedError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::RateLimited);
        EXPECT_EQ(e.attempts(), 3u);
        EXPECT_EQ(e.status_code().value_or(0), 429);
        EXPECT_STREQ(e.what(), "HTTP 429");
    }

    r.error_kind = ErrorKind::Authentication;
    EXPECT_THROW(throw_engine_error(r), AuthenticationError);
    r.error_kind = ErrorKind::CircuitOpen;
    EXPECT_THROW(throw_engine_error(r), CircuitOpenError);
    r.error_kind = ErrorKind::Cancelled;
    EXPECT_THROW(throw_engine_error(r), CancelledError);
    r.error_kind = std::nullopt;
    EXPECT_THROW(throw_engine_error(r), OperationError);
}
