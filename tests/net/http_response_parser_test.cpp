#include "chunkflow/net/http_response_parser.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace chunkflow::net;

namespace {

chunkflow::Result<bool> feed(HttpResponseParser& parser, const std::string& data) {
    return parser.parse(data.data(), data.size());
}

} // namespace

TEST(HttpResponseParserTest, ContentLengthBody) {
    HttpResponseParser parser(HttpMethod::PUT);
    auto done = feed(parser, "HTTP/1.1 201 Created\r\nContent-Length: 5\r\nX-Checksum-Md5: abc\r\n\r\nhello");
    ASSERT_TRUE(done.is_ok()) << done.error();
    EXPECT_TRUE(done.value());
    EXPECT_EQ(parser.response().status_code, 201);
    EXPECT_EQ(parser.response().reason_phrase, "Created");
    EXPECT_EQ(parser.response().body, "hello");
    EXPECT_EQ(parser.response().get_header("x-checksum-md5"), "abc");
}

TEST(HttpResponseParserTest, ByteByByteFeeding) {
    const std::string raw = "HTTP/1.1 200 OK\r\nContent-Length: 3\r\n\r\nabc";
    HttpResponseParser parser;
    for (std::size_t i = 0; i < raw.size(); ++i) {
        auto done = parser.parse(raw.data() + i, 1);
        ASSERT_TRUE(done.is_ok()) << done.error();
        EXPECT_EQ(done.value(), i + 1 == raw.size());
    }
    EXPECT_EQ(parser.response().body, "abc");
}

TEST(HttpResponseParserTest, ChunkedBody) {
    HttpResponseParser parser;
    auto done = feed(parser,
        "HTTP/1.1 500 Internal Server Error\r\nTransfer-Encoding: chunked\r\n\r\n"
        "4\r\nWiki\r\n5;ext=1\r\npedia\r\n0\r\n\r\n");
    ASSERT_TRUE(done.is_ok()) << done.error();
    EXPECT_TRUE(done.value());
    EXPECT_EQ(parser.response().status_code, 500);
    EXPECT_EQ(parser.response().body, "Wikipedia");
}

TEST(HttpResponseParserTest, HeadResponseHasNoBody) {
    HttpResponseParser parser(HttpMethod::HEAD);
    auto done = feed(parser, "HTTP/1.1 200 OK\r\nContent-Length: 1048576\r\n\r\n");
    ASSERT_TRUE(done.is_ok());
    EXPECT_TRUE(done.value());
    EXPECT_EQ(parser.response().get_header("Content-Length"), "1048576");
    EXPECT_TRUE(parser.response().body.empty());
}

TEST(HttpResponseParserTest, InterimContinueIsSkipped) {
    HttpResponseParser parser(HttpMethod::PUT);
    auto done = feed(parser, "HTTP/1.1 100 Continue\r\n\r\nHTTP/1.1 204 No Content\r\n\r\n");
    ASSERT_TRUE(done.is_ok()) << done.error();
    EXPECT_TRUE(done.value());
    EXPECT_EQ(parser.response().status_code, 204);
}

TEST(HttpResponseParserTest, BodyUntilCloseCompletesOnFinish) {
    HttpResponseParser parser;
    auto partial = feed(parser, "HTTP/1.0 503 Service Unavailable\r\n\r\nbusy");
    ASSERT_TRUE(partial.is_ok());
    EXPECT_FALSE(partial.value());

    auto done = parser.finish();
    ASSERT_TRUE(done.is_ok());
    EXPECT_EQ(parser.response().version, HttpVersion::HTTP_1_0);
    EXPECT_EQ(parser.response().body, "busy");
}

TEST(HttpResponseParserTest, TruncatedResponseIsAnError) {
    HttpResponseParser parser;
    ASSERT_TRUE(feed(parser, "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc").is_ok());
    EXPECT_TRUE(parser.finish().is_error());
}

TEST(HttpResponseParserTest, OversizedBodyIsCappedButConsumed) {
    HttpResponseParser parser(HttpMethod::GET, 4);
    auto done = feed(parser, "HTTP/1.1 400 Bad Request\r\nContent-Length: 10\r\n\r\n0123456789");
    ASSERT_TRUE(done.is_ok());
    EXPECT_TRUE(done.value());
    EXPECT_EQ(parser.response().body, "0123");
}

TEST(HttpResponseParserTest, MalformedInputIsRejected) {
    HttpResponseParser bad_version;
    EXPECT_TRUE(feed(bad_version, "HTTX/1.1 200 OK\r\n\r\n").is_error());

    HttpResponseParser bad_status;
    EXPECT_TRUE(feed(bad_status, "HTTP/1.1 2x0 OK\r\n\r\n").is_error());

    HttpResponseParser bad_length;
    EXPECT_TRUE(feed(bad_length, "HTTP/1.1 200 OK\r\nContent-Length: -1\r\n\r\n").is_error());
}

TEST(HttpResponseParserTest, ResetAllowsReuse) {
    HttpResponseParser parser;
    ASSERT_TRUE(feed(parser, "HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n").value());
    parser.reset();
    ASSERT_TRUE(feed(parser, "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n").value());
    EXPECT_EQ(parser.response().status_code, 404);
}
