#pragma once

#include "Dispatcher.hpp"
#include "HandlerRegistry.hpp"
#include "ITransport.hpp"
#include "ServerConfig.hpp"
#include "SessionLifecycle.hpp"
#include "ToolInvocationBridge.hpp"
#include "tools/IToolRegistry.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace quirk_mcp {

using json = nlohmann::ordered_json;

/**
 * @brief MCP Server implementing JSON-RPC 2.0 over a single transport
 *
 * Owns the handler table, session state and tool bridge. Messages are
 * processed strictly in arrival order: the next message is read only after
 * the response to the current one has been written, so a slow tool call
 * delays everything behind it.
 *
 * Supports methods: initialize, notifications/initialized, shutdown, ping,
 * tools/list, tools/call
 */
class MCPServer {
public:
    /**
     * @brief Construct MCP server with transport
     * @param transport Unique pointer to transport implementation
     * @param config Server identity and handshake policy
     * @param tools Tool registry; nullptr disables the tools capability
     */
    explicit MCPServer(std::unique_ptr<ITransport> transport,
                       ServerConfig config = {},
                       std::shared_ptr<IToolRegistry> tools = nullptr);

    MCPServer(const MCPServer&) = delete;
    MCPServer& operator=(const MCPServer&) = delete;

    /**
     * @brief Start server main loop
     *
     * Blocks until shutdown, stop(), end of stream or a framing error.
     *
     * @return false if the loop ended because of a framing error
     */
    bool run();

    /**
     * @brief Signal server to stop before the next read
     *
     * Safe to call from a signal handler.
     */
    void stop();

    /**
     * @brief Process one payload: decode, gate, dispatch, encode
     * @return Serialized response, or std::nullopt for notifications
     */
    std::optional<std::string> process_message(const std::string& payload);

    /**
     * @brief Handler table, for registering extra methods before run()
     */
    HandlerRegistry& handlers() { return handlers_; }

    const SessionLifecycle& lifecycle() const { return lifecycle_; }
    const ServerConfig& config() const { return config_; }

    /**
     * @brief Capabilities advertised by initialize
     * @return {tools: {}} when a tool registry is configured, {} otherwise
     */
    json capabilities() const;

private:
    void register_core_handlers();

    json handle_initialize(const json& params);
    json handle_initialized_notification(const json& params);
    json handle_shutdown(const json& params);
    json handle_cancelled_notification(const json& params);

    std::unique_ptr<ITransport> transport_;
    ServerConfig config_;
    HandlerRegistry handlers_;
    SessionLifecycle lifecycle_;
    ToolInvocationBridge bridge_;
    Dispatcher dispatcher_;
    std::atomic<bool> running_{false};
};

} // namespace quirk_mcp
