#pragma once

#include "ITransport.hpp"
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>

namespace quirk_mcp {

/**
 * @brief Stdio transport with Content-Length framing
 *
 * Reads frames of the form
 *
 *     Content-Length: <n>\r\n
 *     \r\n
 *     <n bytes of UTF-8 JSON>
 *
 * and writes every outgoing payload the same way. When the first line of a
 * message is not a Content-Length header the line itself is taken as one
 * bare JSON payload, which keeps line-delimited peers working.
 */
class MessageFramer : public ITransport {
public:
    static constexpr std::size_t kDefaultMaxContentLength = 16 * 1024 * 1024;

    /**
     * @brief Construct framer over a pair of streams
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     * @param max_content_length Largest accepted frame body in bytes
     */
    explicit MessageFramer(std::istream& in = std::cin,
                           std::ostream& out = std::cout,
                           std::size_t max_content_length = kDefaultMaxContentLength);

    std::optional<std::string> read_message() override;
    void write_message(const std::string& payload) override;
    bool is_open() const override;

    std::size_t max_content_length() const { return max_content_length_; }

    /**
     * @brief Parse a Content-Length header line
     *
     * Header name is matched case-insensitively.
     *
     * @return Declared length, or std::nullopt if the line is not a Content-Length header
     * @throws FramingError if the header is present but its value is not a number
     */
    static std::optional<std::size_t> parse_content_length(const std::string& line);

private:
    bool read_line(std::string& line);

    std::istream& in_;
    std::ostream& out_;
    std::size_t max_content_length_;
};

} // namespace quirk_mcp
