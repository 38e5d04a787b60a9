#include "mcp/MCPServer.hpp"
#include "mcp/MessageFramer.hpp"
#include "tools/ToolRegistry.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using namespace quirk_mcp;

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        tools = std::make_shared<ToolRegistry>();
        tools->register_tool(
            {"echo", "Echo the message argument",
             {{"type", "object"}, {"properties", {{"message", {{"type", "string"}}}}}}},
            [](const json& args) -> json {
                return args.at("message").get<std::string>();
            });
    }

    static std::string frame(const std::string& payload) {
        return "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n" + payload;
    }

    static std::string frame(const json& message) {
        return frame(message.dump());
    }

    /// Run a server over the given input and return the framed output
    std::string run_server(const std::string& input, bool expect_clean = true) {
        std::istringstream in(input);
        std::ostringstream out;

        MCPServer server(std::make_unique<MessageFramer>(in, out), ServerConfig{}, tools);
        EXPECT_EQ(server.run(), expect_clean);
        return out.str();
    }

    /// Split framed output back into payloads
    static std::vector<std::string> unframe(const std::string& output) {
        std::istringstream in(output);
        std::ostringstream sink;
        MessageFramer reader(in, sink);

        std::vector<std::string> payloads;
        while (auto payload = reader.read_message()) {
            payloads.push_back(*payload);
        }
        return payloads;
    }

    std::shared_ptr<ToolRegistry> tools;
};

TEST_F(EndToEndTest, FramedPingRoundTrip) {
    std::string output = run_server(frame(std::string(R"({"protocolVersion":"2.0","id":1,"method":"ping"})")));

    const std::string expected_body = R"({"protocolVersion":"2.0","id":1,"result":{}})";
    EXPECT_EQ(output, "Content-Length: " + std::to_string(expected_body.size()) + "\r\n\r\n" + expected_body);
}

TEST_F(EndToEndTest, FullSession) {
    std::string input =
        frame(json{{"protocolVersion", "2.0"}, {"id", 1}, {"method", "initialize"},
                   {"params", {{"protocolVersion", "2024-11-05"},
                               {"clientInfo", {{"name", "e2e"}, {"version", "1"}}}}}}) +
        frame(json{{"protocolVersion", "2.0"}, {"method", "notifications/initialized"}}) +
        frame(json{{"protocolVersion", "2.0"}, {"id", 2}, {"method", "tools/list"}}) +
        frame(json{{"protocolVersion", "2.0"}, {"id", 3}, {"method", "tools/call"},
                   {"params", {{"name", "echo"}, {"arguments", {{"message", "hi there"}}}}}}) +
        frame(json{{"protocolVersion", "2.0"}, {"id", 4}, {"method", "shutdown"}});

    std::vector<std::string> replies = unframe(run_server(input));
    ASSERT_EQ(replies.size(), 4u);

    json init = json::parse(replies[0]);
    EXPECT_EQ(init["id"], 1);
    EXPECT_EQ(init["result"]["protocolVersion"], "2024-11-05");
    EXPECT_TRUE(init["result"]["capabilities"].contains("tools"));

    json list = json::parse(replies[1]);
    EXPECT_EQ(list["id"], 2);
    ASSERT_EQ(list["result"]["tools"].size(), 1u);
    EXPECT_EQ(list["result"]["tools"][0]["name"], "echo");

    json call = json::parse(replies[2]);
    EXPECT_EQ(call["id"], 3);
    EXPECT_EQ(call["result"]["content"][0]["text"], "hi there");

    json shutdown = json::parse(replies[3]);
    EXPECT_EQ(shutdown["id"], 4);
    EXPECT_EQ(shutdown["result"], json::object());
}

TEST_F(EndToEndTest, LineDelimitedInputIsAccepted) {
    std::string input =
        R"({"jsonrpc":"2.0","id":"a","method":"ping"})" "\n"
        R"({"protocolVersion":"2.0","id":"b","method":"tools/list"})" "\n";

    std::vector<std::string> replies = unframe(run_server(input));
    ASSERT_EQ(replies.size(), 2u);
    EXPECT_EQ(json::parse(replies[0])["id"], "a");
    EXPECT_EQ(json::parse(replies[0])["protocolVersion"], "2.0");
    EXPECT_EQ(json::parse(replies[1])["id"], "b");
}

TEST_F(EndToEndTest, ParseErrorDoesNotEndSession) {
    std::string input =
        frame(std::string("{\"protocolVersion\": \"2.0\", \"id\": 1,")) +
        frame(std::string(R"({"protocolVersion":"2.0","id":2,"method":"ping"})"));

    std::vector<std::string> replies = unframe(run_server(input));
    ASSERT_EQ(replies.size(), 2u);

    json error = json::parse(replies[0]);
    EXPECT_TRUE(error["id"].is_null());
    EXPECT_EQ(error["error"]["code"], -32700);
    EXPECT_EQ(json::parse(replies[1])["id"], 2);
}

TEST_F(EndToEndTest, TruncatedFrameFailsRun) {
    std::string input =
        frame(std::string(R"({"protocolVersion":"2.0","id":1,"method":"ping"})")) +
        "Content-Length: 500\r\n\r\n{\"protocolVersion\":";

    std::vector<std::string> replies = unframe(run_server(input, false));
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(json::parse(replies[0])["id"], 1);
}

TEST_F(EndToEndTest, NotificationsAreSilent) {
    std::string input =
        frame(json{{"protocolVersion", "2.0"}, {"method", "notifications/initialized"}}) +
        frame(json{{"protocolVersion", "2.0"}, {"id", nullptr}, {"method", "ping"}}) +
        frame(json{{"protocolVersion", "2.0"}, {"method", "notifications/cancelled"},
                   {"params", {{"requestId", 7}}}});

    EXPECT_TRUE(run_server(input).empty());
}
