#pragma once

#include "HandlerRegistry.hpp"
#include "ProtocolCodec.hpp"
#include <optional>
#include <string>

namespace quirk_mcp {

/**
 * @brief Routes requests to registered handlers
 *
 * Handler failures never escape: they become INVALID_PARAMS or
 * INTERNAL_ERROR responses. Notifications run for their side effects
 * but never yield a response, not even an error.
 */
class Dispatcher {
public:
    /**
     * @brief Construct dispatcher over a registry
     * @param registry Handler table; must outlive the dispatcher
     */
    explicit Dispatcher(const HandlerRegistry& registry);

    /**
     * @brief Handle a decoded request
     *
     * Blocks until an async handler's future is ready.
     *
     * @return Response, or std::nullopt for notifications
     */
    std::optional<Response> handle(const Request& request) const;

    /**
     * @brief Create JSON-RPC error response
     * @param id Request ID (or null)
     * @param code Error code
     * @param message Error message
     * @param data Optional structured detail
     */
    static Response error_response(const json& id, ErrorCode code, const std::string& message,
                                   std::optional<json> data = std::nullopt);

private:
    json invoke(const Handler& handler, const json& params) const;

    const HandlerRegistry& registry_;
};

} // namespace quirk_mcp
