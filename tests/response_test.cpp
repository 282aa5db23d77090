#include <gtest/gtest.h>
#include "support/MemoryStreams.hpp"
#include "trellis/http/Response.hpp"

using namespace trellis;
using trellis::testing::RecordingWriter;

TEST(ResponseTest, FormatsDefaultHead) {
    EXPECT_EQ(formatResponseHead("200"),
              "HTTP/1.0 200 NA\r\nContent-Type: text/html; charset=utf-8\r\n\r\n");
}

TEST(ResponseTest, FormatsExtraHeaders) {
    ResponseHeaders headers{{"Cache-Control", "no-cache"}, {"X-Id", "7"}};
    EXPECT_EQ(formatResponseHead("404", "text/plain", headers),
              "HTTP/1.0 404 NA\r\nContent-Type: text/plain\r\n"
              "Cache-Control: no-cache\r\nX-Id: 7\r\n\r\n");
}

TEST(ResponseTest, FormatsRawHeaderBlock) {
    EXPECT_EQ(formatResponseHead("302", "text/html", std::string_view("Location: /\r\n")),
              "HTTP/1.0 302 NA\r\nContent-Type: text/html\r\nLocation: /\r\n\r\n");
}

TEST(ResponseTest, HttpErrorWritesStatusAsBody) {
    RecordingWriter writer;
    bool done = false;
    httpError(writer, "403", [&done]() { done = true; }, [](int) { FAIL(); });

    EXPECT_TRUE(done);
    EXPECT_EQ(writer.output(),
              "HTTP/1.0 403 NA\r\nContent-Type: text/html; charset=utf-8\r\n\r\n403");
}

TEST(ResponseTest, StartResponseReportsWriteError) {
    RecordingWriter writer;
    writer.failWrites(EPIPE);
    int error = 0;
    startResponse(writer, "text/plain", "200", {}, []() { FAIL(); }, [&error](int e) { error = e; });

    EXPECT_EQ(error, EPIPE);
}

TEST(ResponseTest, BufferedResponseSerializes) {
    Response res;
    res.text("hello");
    res.setHeader("X-A", "1");
    res.setHeader("X-A", "2");
    res.setStatus("201");

    EXPECT_EQ(res.serialize(), "HTTP/1.0 201 NA\r\nContent-Type: text/plain\r\nX-A: 2\r\n\r\nhello");
}

TEST(ResponseTest, BufferedResponseDefaults) {
    Response res;
    EXPECT_EQ(res.status, "200");
    EXPECT_EQ(res.content_type, DEFAULT_CONTENT_TYPE);
    EXPECT_TRUE(res.body.empty());
}
