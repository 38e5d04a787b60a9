#pragma once

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace quirk_mcp {

using json = nlohmann::ordered_json;

/**
 * @brief JSON-RPC 2.0 error codes plus MCP-specific extensions
 */
enum class ErrorCode : int {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,

    // MCP-specific
    ToolNotFound = -32000,
    ResourceNotFound = -32001,
    PermissionDenied = -32002
};

inline int to_int(ErrorCode code) {
    return static_cast<int>(code);
}

/**
 * @brief Transport-level failure: malformed header, truncated frame, write failure
 *
 * The stream position is no longer trustworthy after this is thrown,
 * so the server loop terminates instead of trying to resynchronize.
 */
class FramingError : public std::runtime_error {
public:
    explicit FramingError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Payload could not be turned into a Request envelope
 *
 * Carries the error code to report (ParseError or InvalidRequest) and the
 * request id when it could still be recovered from the payload (null otherwise).
 */
class MalformedPayload : public std::runtime_error {
public:
    MalformedPayload(ErrorCode code, const std::string& message, json id = nullptr)
        : std::runtime_error(message), code_(code), id_(std::move(id)) {}

    ErrorCode code() const { return code_; }
    const json& id() const { return id_; }

private:
    ErrorCode code_;
    json id_;
};

/**
 * @brief Thrown by handlers when the params object has the wrong shape
 *
 * The dispatcher reports it as INVALID_PARAMS instead of INTERNAL_ERROR.
 */
class InvalidParams : public std::invalid_argument {
public:
    explicit InvalidParams(const std::string& message)
        : std::invalid_argument(message) {}
};

} // namespace quirk_mcp
