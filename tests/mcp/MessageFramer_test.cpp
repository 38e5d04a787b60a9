#include "mcp/MessageFramer.hpp"
#include "mcp/Errors.hpp"
#include <gtest/gtest.h>
#include <sstream>

using namespace quirk_mcp;

class MessageFramerTest : public ::testing::Test {
protected:
    std::istringstream input;
    std::ostringstream output;

    std::string frame(const std::string& body) {
        return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
    }
};

TEST_F(MessageFramerTest, ReadsContentLengthFrame) {
    const std::string body = R"({"protocolVersion":"2.0","method":"ping","id":1})";
    input.str(frame(body));
    MessageFramer framer(input, output);

    auto message = framer.read_message();
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(*message, body);
    EXPECT_FALSE(framer.read_message().has_value());
}

TEST_F(MessageFramerTest, ReadsConsecutiveFrames) {
    input.str(frame(R"({"a":1})") + frame(R"({"b":2})"));
    MessageFramer framer(input, output);

    EXPECT_EQ(framer.read_message().value(), R"({"a":1})");
    EXPECT_EQ(framer.read_message().value(), R"({"b":2})");
    EXPECT_FALSE(framer.read_message().has_value());
}

TEST_F(MessageFramerTest, HeaderNameIsCaseInsensitive) {
    input.str("content-length: 7\r\n\r\n{\"a\":1}");
    MessageFramer framer(input, output);

    EXPECT_EQ(framer.read_message().value(), "{\"a\":1}");
}

TEST_F(MessageFramerTest, IgnoresAdditionalHeaders) {
    input.str("Content-Length: 7\r\n"
              "Content-Type: application/vscode-jsonrpc; charset=utf-8\r\n"
              "\r\n"
              "{\"a\":1}");
    MessageFramer framer(input, output);

    EXPECT_EQ(framer.read_message().value(), "{\"a\":1}");
}

TEST_F(MessageFramerTest, BodyMayContainNewlines) {
    const std::string body = "{\n  \"a\": 1\n}";
    input.str(frame(body));
    MessageFramer framer(input, output);

    EXPECT_EQ(framer.read_message().value(), body);
}

TEST_F(MessageFramerTest, LengthCountsUtf8Bytes) {
    const std::string body = "{\"text\":\"h\xC3\xA9llo\"}";  // é is two bytes
    input.str(frame(body));
    MessageFramer framer(input, output);

    EXPECT_EQ(framer.read_message().value(), body);
}

TEST_F(MessageFramerTest, FallsBackToLineDelimitedJson) {
    input.str("{\"protocolVersion\":\"2.0\",\"method\":\"ping\",\"id\":1}\n"
              "{\"protocolVersion\":\"2.0\",\"method\":\"ping\",\"id\":2}\r\n");
    MessageFramer framer(input, output);

    EXPECT_EQ(framer.read_message().value(), "{\"protocolVersion\":\"2.0\",\"method\":\"ping\",\"id\":1}");
    EXPECT_EQ(framer.read_message().value(), "{\"protocolVersion\":\"2.0\",\"method\":\"ping\",\"id\":2}");
    EXPECT_FALSE(framer.read_message().has_value());
}

TEST_F(MessageFramerTest, SkipsBlankSeparatorLines) {
    input.str("\n\r\n" + frame("{}") + "\n\n{\"x\":1}\n");
    MessageFramer framer(input, output);

    EXPECT_EQ(framer.read_message().value(), "{}");
    EXPECT_EQ(framer.read_message().value(), "{\"x\":1}");
    EXPECT_FALSE(framer.read_message().has_value());
}

TEST_F(MessageFramerTest, EmptyStreamIsEndOfStream) {
    MessageFramer framer(input, output);
    EXPECT_FALSE(framer.read_message().has_value());
}

TEST_F(MessageFramerTest, TruncatedBodyIsFramingError) {
    input.str("Content-Length: 100\r\n\r\n{\"short\":true}");
    MessageFramer framer(input, output);

    EXPECT_THROW(framer.read_message(), FramingError);
}

TEST_F(MessageFramerTest, EofInsideHeaderIsFramingError) {
    input.str("Content-Length: 10\r\n");
    MessageFramer framer(input, output);

    EXPECT_THROW(framer.read_message(), FramingError);
}

TEST_F(MessageFramerTest, NonNumericLengthIsFramingError) {
    input.str("Content-Length: abc\r\n\r\n{}");
    MessageFramer framer(input, output);

    EXPECT_THROW(framer.read_message(), FramingError);
}

TEST_F(MessageFramerTest, OversizedFrameIsFramingError) {
    input.str(frame("{\"a\":1}"));
    MessageFramer framer(input, output, 4);

    EXPECT_THROW(framer.read_message(), FramingError);
}

TEST_F(MessageFramerTest, WritesContentLengthFrame) {
    MessageFramer framer(input, output);
    const std::string body = R"({"protocolVersion":"2.0","id":1,"result":{}})";

    framer.write_message(body);

    EXPECT_EQ(output.str(), "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body);
}

TEST_F(MessageFramerTest, WriteLengthIsByteCount) {
    MessageFramer framer(input, output);
    framer.write_message("\xE2\x9C\x93");  // ✓, three bytes

    EXPECT_EQ(output.str(), "Content-Length: 3\r\n\r\n\xE2\x9C\x93");
}

TEST_F(MessageFramerTest, WriteToFailedStreamThrows) {
    output.setstate(std::ios::badbit);
    MessageFramer framer(input, output);

    EXPECT_THROW(framer.write_message("{}"), FramingError);
}

TEST(MessageFramerHeaderTest, ParseContentLength) {
    EXPECT_EQ(MessageFramer::parse_content_length("Content-Length: 42"), 42u);
    EXPECT_EQ(MessageFramer::parse_content_length("CONTENT-LENGTH:7"), 7u);
    EXPECT_EQ(MessageFramer::parse_content_length("Content-Length:   0  "), 0u);
    EXPECT_FALSE(MessageFramer::parse_content_length("{\"a\":1}").has_value());
    EXPECT_FALSE(MessageFramer::parse_content_length("Content-Type: text").has_value());
    EXPECT_THROW(MessageFramer::parse_content_length("Content-Length: -1"), FramingError);
}
