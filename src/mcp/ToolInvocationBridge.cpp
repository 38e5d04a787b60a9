#include "ToolInvocationBridge.hpp"
#include "Errors.hpp"
#include "SessionLifecycle.hpp"
#include <spdlog/spdlog.h>

namespace quirk_mcp {

namespace {

std::future<json> ready_error(const std::string& text) {
    std::promise<json> promise;
    promise.set_value({
        {"content", json::array({
            {
                {"type", "text"},
                {"text", text}
            }
        })},
        {"isError", true}
    });
    return promise.get_future();
}

} // namespace

ToolInvocationBridge::ToolInvocationBridge(std::shared_ptr<IToolRegistry> tools)
    : tools_(std::move(tools)) {}

void ToolInvocationBridge::register_with(HandlerRegistry& registry) {
    registry.register_sync(methods::kToolsList,
        [this](const json& params) { return list_tools(params); });
    registry.register_async(methods::kToolsCall,
        [this](const json& params) { return call_tool(params); });
}

json ToolInvocationBridge::list_tools(const json& /*params*/) const {
    if (!tools_) {
        return {{"tools", json::array()}};
    }

    json tools_array = tools_->list_tools();
    spdlog::debug("Returning {} tools", tools_array.size());
    return {{"tools", tools_array}};
}

std::future<json> ToolInvocationBridge::call_tool(const json& params) const {
    if (!tools_) {
        return ready_error("No tools available");
    }

    auto name = params.find("name");
    if (name == params.end() || !name->is_string() || name->get<std::string>().empty()) {
        return ready_error("Missing tool name");
    }

    json arguments = json::object();
    auto args = params.find("arguments");
    if (args != params.end() && !args->is_null()) {
        if (!args->is_object()) {
            throw InvalidParams("arguments must be an object");
        }
        arguments = *args;
    }

    const std::string tool_name = name->get<std::string>();
    spdlog::info("Calling tool: {}", tool_name);
    return tools_->call_tool(tool_name, arguments);
}

} // namespace quirk_mcp
