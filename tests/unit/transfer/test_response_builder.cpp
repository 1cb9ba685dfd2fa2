/**
 * @file test_response_builder.cpp
 * @brief Unit tests for header section parsing
 */

#include <gtest/gtest.h>

#include <kcenon/curl_transfer/transfer/transfer_response.h>

#include <string>
#include <vector>

namespace kcenon::curl_transfer::test {

class ResponseBuilderTest : public ::testing::Test {
protected:
    static auto build(std::vector<std::string> lines, long fallback = 0) -> transfer_response {
        return response_builder::build("http://localhost/x", lines, fallback);
    }
};

// =============================================================================
// Status line
// =============================================================================

TEST_F(ResponseBuilderTest, HttpStatusAndHeader) {
    auto response = build({"HTTP/1.1 200 OK", "Content-Type: text/plain", ""});

    EXPECT_EQ(response.status_code(), 200);
    ASSERT_EQ(response.headers().size(), 1u);
    EXPECT_EQ(response.headers().at("content-type"), "text/plain");
    EXPECT_EQ(response.url(), "http://localhost/x");
}

TEST_F(ResponseBuilderTest, LinesWithLineEndings) {
    auto response = build({"HTTP/1.1 404 Not Found\r\n", "Content-Length: 12\r\n", "\r\n"});

    EXPECT_EQ(response.status_code(), 404);
    EXPECT_EQ(response.headers().at("content-length"), "12");
    EXPECT_EQ(response.content_length(), 12);
}

TEST_F(ResponseBuilderTest, Http2StatusWithoutReason) {
    auto response = build({"HTTP/2 204"});
    EXPECT_EQ(response.status_code(), 204);
}

TEST_F(ResponseBuilderTest, InterimResponse) {
    auto response = build({"HTTP/1.1 100 Continue", ""});

    EXPECT_EQ(response.status_code(), 100);
    EXPECT_TRUE(response.is_interim());
    EXPECT_TRUE(response.headers().empty());
}

TEST_F(ResponseBuilderTest, FtpReplies) {
    EXPECT_EQ(build({"220 Service ready\r\n"}).status_code(), 220);
    EXPECT_EQ(build({"230-Welcome\r\n", "230 Logged in\r\n"}).status_code(), 230);
    EXPECT_EQ(build({"226"}).status_code(), 226);
}

TEST_F(ResponseBuilderTest, UnparsableStatusUsesFallback) {
    auto response = build({"Garbage line", "X-Test: 1"}, 301);

    EXPECT_EQ(response.status_code(), 301);
    EXPECT_EQ(response.headers().at("x-test"), "1");
}

TEST_F(ResponseBuilderTest, NoStatusAndNoFallbackIsZero) {
    EXPECT_EQ(build({"Content-Length: 5"}).status_code(), 0);
    EXPECT_EQ(build({}).status_code(), 0);
}

TEST_F(ResponseBuilderTest, ParseStatusLine) {
    EXPECT_EQ(response_builder::parse_status_line("HTTP/1.0 503 Service Unavailable"), 503);
    EXPECT_EQ(response_builder::parse_status_line("http/1.1 200 OK"), 200);
    EXPECT_FALSE(response_builder::parse_status_line("HTTP/1.1 20 OK").has_value());
    EXPECT_FALSE(response_builder::parse_status_line("2000 too long").has_value());
    EXPECT_FALSE(response_builder::parse_status_line("abc").has_value());
}

// =============================================================================
// Header fields
// =============================================================================

TEST_F(ResponseBuilderTest, NamesAreLowerCasedAndLookupIgnoresCase) {
    auto response = build({"HTTP/1.1 200 OK", "X-Custom-Header: Value"});

    EXPECT_EQ(response.headers().count("x-custom-header"), 1u);
    EXPECT_EQ(response.header("X-CUSTOM-HEADER"), "Value");
    EXPECT_FALSE(response.header("missing").has_value());
}

TEST_F(ResponseBuilderTest, DuplicateHeadersAreFolded) {
    auto response = build({"HTTP/1.1 200 OK", "Set-Cookie: a=1", "set-cookie: b=2"});

    EXPECT_EQ(response.headers().at("set-cookie"), "a=1, b=2");
}

TEST_F(ResponseBuilderTest, ContinuationLineAppendsToPreviousValue) {
    auto response = build({"HTTP/1.1 200 OK", "X-Long: first", "\tsecond", "  third"});

    EXPECT_EQ(response.headers().at("x-long"), "first second third");
}

TEST_F(ResponseBuilderTest, LinesWithoutColonAreIgnored) {
    auto response = build({"HTTP/1.1 200 OK", "not a header", "Server: test"});

    ASSERT_EQ(response.headers().size(), 1u);
    EXPECT_EQ(response.headers().at("server"), "test");
}

TEST_F(ResponseBuilderTest, ValuesAreTrimmed) {
    auto response = build({"HTTP/1.1 200 OK", "Location:    /next   "});

    EXPECT_EQ(response.headers().at("location"), "/next");
}

TEST_F(ResponseBuilderTest, EmptyValueIsKept) {
    auto response = build({"HTTP/1.1 200 OK", "X-Empty:"});

    EXPECT_EQ(response.header("x-empty"), "");
}

TEST_F(ResponseBuilderTest, ContentLengthRejectsNonNumeric) {
    auto response = build({"HTTP/1.1 200 OK", "Content-Length: lots"});
    EXPECT_FALSE(response.content_length().has_value());
}

}  // namespace kcenon::curl_transfer::test
