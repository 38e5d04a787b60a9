#include "MessageFramer.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace quirk_mcp {

namespace {

constexpr const char* kContentLengthHeader = "content-length:";

std::string trim(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(),
        [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(),
        [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

MessageFramer::MessageFramer(std::istream& in, std::ostream& out, std::size_t max_content_length)
    : in_(in), out_(out), max_content_length_(max_content_length) {
    spdlog::debug("MessageFramer initialized (max frame {} bytes)", max_content_length_);
}

bool MessageFramer::read_line(std::string& line) {
    if (!std::getline(in_, line)) {
        if (in_.bad()) {
            throw FramingError("Error reading from input stream");
        }
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

std::optional<std::size_t> MessageFramer::parse_content_length(const std::string& line) {
    const std::string header(kContentLengthHeader);
    if (line.size() < header.size()) {
        return std::nullopt;
    }

    bool matches = std::equal(header.begin(), header.end(), line.begin(),
        [](char expected, char actual) {
            return expected == std::tolower(static_cast<unsigned char>(actual));
        });
    if (!matches) {
        return std::nullopt;
    }

    std::string value = trim(line.substr(header.size()));
    if (value.empty() || !std::all_of(value.begin(), value.end(),
            [](unsigned char c) { return std::isdigit(c); })) {
        throw FramingError("Invalid Content-Length value: '" + value + "'");
    }

    try {
        return static_cast<std::size_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        throw FramingError("Content-Length value out of range: " + value);
    }
}

std::optional<std::string> MessageFramer::read_message() {
    std::string line;

    // Blank lines between messages are separators, not payloads
    do {
        if (!read_line(line)) {
            spdlog::debug("Reached end of input stream");
            return std::nullopt;
        }
    } while (trim(line).empty());

    std::optional<std::size_t> content_length = parse_content_length(line);
    if (!content_length) {
        spdlog::debug("Read line-delimited message: {}", line);
        return line;
    }

    // Remaining headers (e.g. Content-Type) are ignored up to the blank terminator
    std::string header;
    while (true) {
        if (!read_line(header)) {
            throw FramingError("Unexpected end of stream inside frame header");
        }
        if (header.empty()) {
            break;
        }
        spdlog::trace("Ignoring frame header: {}", header);
    }

    if (*content_length > max_content_length_) {
        throw FramingError("Frame of " + std::to_string(*content_length) +
                           " bytes exceeds limit of " + std::to_string(max_content_length_));
    }

    std::string body(*content_length, '\0');
    in_.read(body.data(), static_cast<std::streamsize>(*content_length));
    auto received = static_cast<std::size_t>(in_.gcount());
    if (received != *content_length) {
        throw FramingError("Truncated frame: expected " + std::to_string(*content_length) +
                           " bytes, got " + std::to_string(received));
    }

    spdlog::debug("Read framed message: {}", body);
    return body;
}

void MessageFramer::write_message(const std::string& payload) {
    out_ << "Content-Length: " << payload.size() << "\r\n\r\n" << payload;
    out_.flush();
    if (out_.fail()) {
        throw FramingError("Failed to write frame to output stream");
    }
    spdlog::debug("Wrote message: {}", payload);
}

bool MessageFramer::is_open() const {
    return in_.good() && out_.good();
}

} // namespace quirk_mcp
