#pragma once

#include <optional>
#include <string>

namespace quirk_mcp {

/**
 * @brief Abstract interface for MCP transport mechanisms
 *
 * Implementations move one complete JSON payload at a time. Payloads are
 * raw text: parsing and validation happen in ProtocolCodec.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read next complete payload from transport
     * @return Payload text, or std::nullopt on clean end of stream
     * @throws FramingError if the stream is corrupt or truncated
     */
    virtual std::optional<std::string> read_message() = 0;

    /**
     * @brief Write one payload to transport
     * @param payload Serialized JSON text
     * @throws FramingError if the payload could not be written
     */
    virtual void write_message(const std::string& payload) = 0;

    /**
     * @brief Check if transport is still open
     * @return true if transport can read/write, false otherwise
     */
    virtual bool is_open() const = 0;
};

} // namespace quirk_mcp
