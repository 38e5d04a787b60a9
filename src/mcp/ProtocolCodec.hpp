#pragma once

#include "Errors.hpp"
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace quirk_mcp {

using json = nlohmann::ordered_json;

/// Envelope version carried in every message
constexpr const char* kEnvelopeVersion = "2.0";

/// MCP protocol revision advertised by initialize
constexpr const char* kMcpProtocolVersion = "2024-11-05";

/**
 * @brief Incoming JSON-RPC request or notification
 *
 * A request without id is a notification and never produces a response.
 * params is always an object; an omitted params field decodes to {}.
 */
struct Request {
    std::string method;
    std::optional<json> id;
    json params = json::object();

    bool is_notification() const { return !id.has_value(); }
};

/**
 * @brief Error member of an error response
 */
struct ErrorObject {
    int code = to_int(ErrorCode::InternalError);
    std::string message;
    std::optional<json> data;

    json to_json() const;
};

/**
 * @brief Outgoing response: exactly one of result or error is set
 *
 * Build through success() / failure() so the invariant holds.
 */
struct Response {
    json id;
    std::optional<json> result;
    std::optional<ErrorObject> error;

    static Response success(json id, json result);
    static Response failure(json id, ErrorObject error);

    bool is_error() const { return error.has_value(); }
};

/**
 * @brief Converts between payload text and typed envelopes
 */
class ProtocolCodec {
public:
    /**
     * @brief Parse and validate a request envelope
     *
     * Accepts "jsonrpc" as an alias for the "protocolVersion" field.
     *
     * @param text Raw payload from the transport
     * @return Decoded request
     * @throws MalformedPayload with ParseError for invalid JSON, InvalidRequest
     *         for a well-formed value that is not a valid envelope
     */
    static Request parse_request(const std::string& text);

    /**
     * @brief Build the wire object for a response
     *
     * Key order is protocolVersion, id, then result or error.
     */
    static json to_json(const Response& response);

    /**
     * @brief Serialize a response to compact JSON text
     *
     * Invalid UTF-8 in strings is replaced rather than failing the write.
     */
    static std::string serialize_response(const Response& response);

private:
    static json recover_id(const json& payload);
};

} // namespace quirk_mcp
