#pragma once

#include "HandlerRegistry.hpp"
#include "tools/IToolRegistry.hpp"
#include <future>
#include <memory>
#include <nlohmann/json.hpp>

namespace quirk_mcp {

using json = nlohmann::ordered_json;

/**
 * @brief Exposes a Tool Registry through tools/list and tools/call
 *
 * Tool-level failures (no registry, missing name, failed tool) are
 * successful results with isError set; only a malformed arguments field
 * is reported as a protocol error.
 */
class ToolInvocationBridge {
public:
    /**
     * @brief Construct bridge
     * @param tools Tool registry, or nullptr when the server has no tools
     */
    explicit ToolInvocationBridge(std::shared_ptr<IToolRegistry> tools);

    /**
     * @brief Register tools/list (sync) and tools/call (async) handlers
     *
     * The handlers keep a pointer to this bridge, which must outlive them.
     */
    void register_with(HandlerRegistry& registry);

    bool has_tools() const { return tools_ != nullptr; }

    /**
     * @brief Handle tools/list method
     * @return {tools: [...]}
     */
    json list_tools(const json& params) const;

    /**
     * @brief Handle tools/call method
     * @param params {name, arguments?}
     * @return Future tool result
     * @throws InvalidParams if arguments is present and not an object
     */
    std::future<json> call_tool(const json& params) const;

private:
    std::shared_ptr<IToolRegistry> tools_;
};

} // namespace quirk_mcp
