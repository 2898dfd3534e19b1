#include "http_server.hpp"
#include "fakes.hpp"
#include "mode_controller.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>

class HttpReplyTest : public ::testing::Test {
protected:
    HttpReplyTest()
        : controller(frames, locator, actuator, audio, fastTiming(), 0.7), routes(controller) {}

    static bool hasCorsHeader(const HttpReply& reply) {
        for (const auto& header : reply.headers) {
            if (header.first == "access-control-allow-origin:" && header.second == "*") return true;
        }
        return false;
    }

    FakeFrameSource frames;
    FakeFaceLocator locator;
    RecordingActuator actuator;
    FakeAudioLooper audio;
    ModeController controller;
    ApiRoutes routes;
    HttpSession session{};
};

TEST_F(HttpReplyTest, StatusIsJsonWithCors) {
    beginRequest(session, "GET", "/api/status");
    HttpReply reply = buildReply(routes, session);

    EXPECT_EQ(reply.status, 200);
    EXPECT_EQ(reply.contentType, "application/json");
    EXPECT_TRUE(hasCorsHeader(reply));
    nlohmann::json body = nlohmann::json::parse(reply.body);
    EXPECT_EQ(body["tracking_active"], false);
}

TEST_F(HttpReplyTest, ErrorRepliesCarryCorsToo) {
    beginRequest(session, "GET", "/nowhere");
    HttpReply reply = buildReply(routes, session);
    EXPECT_EQ(reply.status, 404);
    EXPECT_TRUE(hasCorsHeader(reply));
}

TEST_F(HttpReplyTest, BodyArrivesInChunks) {
    beginRequest(session, "POST", "/api/settings");
    std::string first = R"({"smoothing_)";
    std::string second = R"(factor": 0.4})";
    ASSERT_TRUE(appendBodyChunk(session, first.data(), first.size()));
    ASSERT_TRUE(appendBodyChunk(session, second.data(), second.size()));

    HttpReply reply = buildReply(routes, session);
    EXPECT_EQ(reply.status, 200);
    EXPECT_DOUBLE_EQ(controller.smoothingFactor(), 0.4);
}

TEST_F(HttpReplyTest, OversizedBodyIs413) {
    beginRequest(session, "POST", "/api/settings");
    std::string filler(MAX_REQUEST_BODY - 10, ' ');
    ASSERT_TRUE(appendBodyChunk(session, filler.data(), filler.size()));

    std::string rest = R"({"smoothing_factor": 0.1})";
    EXPECT_FALSE(appendBodyChunk(session, rest.data(), rest.size()));
    EXPECT_TRUE(session.bodyTooLarge);

    // Later chunks stay rejected even if they would fit
    EXPECT_FALSE(appendBodyChunk(session, "x", 1));

    HttpReply reply = buildReply(routes, session);
    EXPECT_EQ(reply.status, 413);
    EXPECT_TRUE(hasCorsHeader(reply));
    EXPECT_DOUBLE_EQ(controller.smoothingFactor(), 0.7);
}

TEST_F(HttpReplyTest, BodyExactlyAtLimitIsAccepted) {
    beginRequest(session, "POST", "/api/spin_once");
    std::string body(MAX_REQUEST_BODY, ' ');
    EXPECT_TRUE(appendBodyChunk(session, body.data(), body.size()));
    EXPECT_EQ(buildReply(routes, session).status, 200);
    EXPECT_EQ(actuator.spinCount(), 1u);
}

TEST_F(HttpReplyTest, BeginRequestClearsPreviousBody) {
    beginRequest(session, "POST", "/api/settings");
    ASSERT_TRUE(appendBodyChunk(session, "{}", 2));
    session.bodyTooLarge = true;

    beginRequest(session, "GET", "/api/test");
    EXPECT_EQ(session.bodyLength, 0u);
    EXPECT_FALSE(session.bodyTooLarge);
    EXPECT_STREQ(session.method, "GET");
    EXPECT_STREQ(session.path, "/api/test");
}

TEST_F(HttpReplyTest, LongPathIsTruncatedNotOverrun) {
    std::string path = "/" + std::string(1000, 'a');
    beginRequest(session, "GET", path.c_str());
    EXPECT_EQ(std::string(session.path).size(), sizeof(session.path) - 1);
    EXPECT_EQ(buildReply(routes, session).status, 404);
}
