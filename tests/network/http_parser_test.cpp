#include "fetchd/network/http_parser.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace fetchd::network;

namespace {

fetchd::Result<bool> feed(HttpParser& parser, const std::string& text) {
    return parser.parse(text.data(), text.size());
}

} // namespace

TEST(HttpParserTest, ParsesRequestWithQueryAndHeaders) {
    HttpParser parser;

    auto done = feed(parser, "GET /progress?session=abc HTTP/1.1\r\nHost: localhost\r\nCookie: fetchd_session=42\r\n\r\n");

    ASSERT_TRUE(done.is_ok());
    EXPECT_TRUE(done.value());
    auto request = parser.get_request();
    EXPECT_EQ(request.method, HttpMethod::GET);
    EXPECT_EQ(request.path(), "/progress");
    EXPECT_EQ(request.query_string(), "session=abc");
    EXPECT_EQ(request.get_header("cookie"), "fetchd_session=42");
}

TEST(HttpParserTest, WaitsForWholeBodyAcrossChunks) {
    HttpParser parser;
    const std::string body = R"({"url":"https://example.test/v"})";

    auto head = feed(parser, "POST /download HTTP/1.1\r\nContent-Type: application/json\r\nContent-Length: " +
                                 std::to_string(body.size()) + "\r\n\r\n");
    ASSERT_TRUE(head.is_ok());
    EXPECT_FALSE(head.value());

    auto first = feed(parser, body.substr(0, 10));
    ASSERT_TRUE(first.is_ok());
    EXPECT_FALSE(first.value());

    auto rest = feed(parser, body.substr(10));
    ASSERT_TRUE(rest.is_ok());
    EXPECT_TRUE(rest.value());
    EXPECT_EQ(parser.get_request().body_as_string(), body);
}

TEST(HttpParserTest, RejectsUnknownMethod) {
    HttpParser parser;

    auto result = feed(parser, "BREW /pot HTTP/1.1\r\n\r\n");

    ASSERT_TRUE(result.is_error());
    EXPECT_FALSE(parser.body_too_large());
}

TEST(HttpParserTest, RejectsBadContentLength) {
    HttpParser parser;

    auto result = feed(parser, "POST /download HTTP/1.1\r\nContent-Length: 12abc\r\n\r\n");

    ASSERT_TRUE(result.is_error());
}

TEST(HttpParserTest, FlagsOversizedBody) {
    HttpParser parser;

    auto result = feed(parser, "POST /download HTTP/1.1\r\nContent-Length: " +
                                   std::to_string(HttpParser::kMaxBodySize + 1) + "\r\n\r\n");

    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(parser.body_too_large());
}

TEST(HttpParserTest, ResetAllowsReuse) {
    HttpParser parser;
    ASSERT_TRUE(feed(parser, "BAD\r\n").is_error());

    parser.reset();

    auto result = feed(parser, "POST /cancel HTTP/1.0\r\n\r\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_EQ(parser.get_request().version, HttpVersion::HTTP_1_0);
}
