#pragma once

#include "IToolRegistry.hpp"
#include <functional>
#include <future>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace quirk_mcp {

using json = nlohmann::ordered_json;

/**
 * @brief Metadata for an MCP tool
 */
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for tool arguments

    json to_json() const;
};

/**
 * @brief Function signature for tool execution
 * @param args JSON object with tool arguments
 * @return Raw tool output, normalized into MCP content by the registry
 */
using ToolHandler = std::function<json(const json& args)>;

/**
 * @brief Tool execution that completes later (I/O bound tools)
 */
using AsyncToolHandler = std::function<std::future<json>(const json& args)>;

/**
 * @brief In-process tool registry
 *
 * Tools are listed in registration order. Tool failures are reported as
 * tool results with isError set, never as exceptions:
 * - unknown tool -> "Unknown tool: <name>"
 * - handler throws -> "Error: <what>"
 *
 * Raw handler output is normalized:
 * - string -> one text block
 * - object with "content" -> returned unchanged
 * - other object or array -> text block with the JSON indented by 2
 * - other scalars -> text block with their JSON text
 */
class ToolRegistry : public IToolRegistry {
public:
    /**
     * @brief Register a tool with handler (replaces a tool with the same name)
     * @throws std::invalid_argument on empty name or null handler
     */
    void register_tool(const ToolInfo& info, ToolHandler handler);

    /**
     * @brief Register a tool whose handler returns a future
     * @throws std::invalid_argument on empty name or null handler
     */
    void register_async_tool(const ToolInfo& info, AsyncToolHandler handler);

    /**
     * @brief Remove a tool
     * @return true if the tool existed
     */
    bool unregister_tool(const std::string& name);

    std::optional<ToolInfo> get_tool(const std::string& name) const;
    std::size_t size() const { return order_.size(); }

    json list_tools() const override;
    std::future<json> call_tool(const std::string& name, const json& arguments) override;

    /**
     * @brief Convert raw handler output to an MCP tool result
     */
    static json normalize_result(const json& raw);

    /**
     * @brief Build {content: [{type: "text", text}], isError: true}
     */
    static json error_result(const std::string& text);

private:
    struct Entry {
        ToolInfo info;
        ToolHandler sync;
        AsyncToolHandler async;
    };

    void add_entry(Entry entry);

    std::map<std::string, Entry> tools_;
    std::vector<std::string> order_;
};

} // namespace quirk_mcp
