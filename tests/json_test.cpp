#include <gtest/gtest.h>
#include "support/MemoryStreams.hpp"
#include "trellis/http/Application.hpp"
#include "trellis/http/Json.hpp"

using namespace trellis;
using trellis::testing::RecordingWriter;
using trellis::testing::ScriptedReader;

TEST(JsonTest, WritesJsonHeadAndCompactBody) {
    RecordingWriter writer;
    bool done = false;
    jsonify(writer, nlohmann::json{{"name", "trellis"}, {"count", 3}},
            [&done]() { done = true; }, [](int) { FAIL(); });

    EXPECT_TRUE(done);
    EXPECT_EQ(writer.output(),
              "HTTP/1.0 200 NA\r\nContent-Type: application/json\r\n\r\n"
              "{\"count\":3,\"name\":\"trellis\"}");
}

TEST(JsonTest, SerializesArraysAndNull) {
    RecordingWriter writer;
    jsonify(writer, nlohmann::json::array({1, "two", nullptr}), []() {}, [](int) { FAIL(); });

    std::string out = writer.output();
    EXPECT_EQ(out.substr(out.find("\r\n\r\n") + 4), "[1,\"two\",null]");
}

TEST(JsonTest, ReportsWriteError) {
    RecordingWriter writer;
    writer.failWrites(EPIPE);
    int error = 0;
    jsonify(writer, nlohmann::json::object(), []() { FAIL(); }, [&error](int e) { error = e; });

    EXPECT_EQ(error, EPIPE);
}

TEST(JsonTest, InvalidUtf8ThrowsBeforeWriting) {
    RecordingWriter writer;
    EXPECT_THROW(jsonify(writer, nlohmann::json("\xff\xfe"), []() {}, [](int) {}),
                 nlohmann::json::type_error);
    EXPECT_EQ(writer.writes(), 0u);
}

TEST(JsonTest, InvalidUtf8InHandlerIsHandlerFailure) {
    class CountingApp : public Application {
      public:
        using Application::Application;
        void handleError(const Request*, StreamWriter&, const DispatchError& error, ErrorDone) override {
            kinds.push_back(error.kind);
        }
        std::vector<ErrorKind> kinds;
    };

    auto app = std::make_shared<CountingApp>("", std::vector<RouteEntry>{}, false);
    app->route("/bad", [](Request&, const WriterPtr& writer, HandlerDone done) {
        jsonify(*writer, nlohmann::json{{"v", "\xff"}},
            [done]() { done(HandlerResult::close()); },
            [done](int error) { done(HandlerResult::failure(ErrorKind::WriteFailure, "json", error)); });
    });
    auto writer = std::make_shared<RecordingWriter>();
    app->handleConnection(ScriptedReader::of("GET /bad HTTP/1.0\r\n\r\n"), writer);

    ASSERT_EQ(app->kinds.size(), 1u);
    EXPECT_EQ(app->kinds[0], ErrorKind::HandlerFailure);
    EXPECT_EQ(writer->writes(), 0u);
    EXPECT_TRUE(writer->isClosed());
}
