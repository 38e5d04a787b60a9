#pragma once

#include <future>
#include <string>
#include <nlohmann/json.hpp>

namespace quirk_mcp {

using json = nlohmann::ordered_json;

/**
 * @brief Collaborator owning the set of invocable tools
 *
 * The server only lists and calls tools through this interface; what the
 * tools actually do lives behind it.
 */
class IToolRegistry {
public:
    virtual ~IToolRegistry() = default;

    /**
     * @brief Describe all tools
     * @return JSON array of {name, description, inputSchema}
     */
    virtual json list_tools() const = 0;

    /**
     * @brief Execute a tool
     * @param name Tool name
     * @param arguments Tool arguments (object)
     * @return Future MCP tool result: {content: [...], isError?: bool}
     */
    virtual std::future<json> call_tool(const std::string& name, const json& arguments) = 0;
};

} // namespace quirk_mcp
