#include "ToolRegistry.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace quirk_mcp {

namespace {

std::future<json> ready(json value) {
    std::promise<json> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
}

json text_content(const std::string& text) {
    return json::array({
        {
            {"type", "text"},
            {"text", text}
        }
    });
}

std::string to_text(const json& value, int indent) {
    return value.dump(indent, ' ', false, json::error_handler_t::replace);
}

} // namespace

json ToolInfo::to_json() const {
    return {
        {"name", name},
        {"description", description},
        {"inputSchema", input_schema.is_null() ? json{{"type", "object"}} : input_schema}
    };
}

void ToolRegistry::add_entry(Entry entry) {
    if (entry.info.name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }

    const std::string name = entry.info.name;
    if (tools_.count(name) == 0) {
        order_.push_back(name);
    }
    tools_[name] = std::move(entry);
    spdlog::info("Registered tool: {}", name);
}

void ToolRegistry::register_tool(const ToolInfo& info, ToolHandler handler) {
    if (!handler) {
        throw std::invalid_argument("Tool handler cannot be null");
    }
    add_entry(Entry{info, std::move(handler), nullptr});
}

void ToolRegistry::register_async_tool(const ToolInfo& info, AsyncToolHandler handler) {
    if (!handler) {
        throw std::invalid_argument("Tool handler cannot be null");
    }
    add_entry(Entry{info, nullptr, std::move(handler)});
}

bool ToolRegistry::unregister_tool(const std::string& name) {
    if (tools_.erase(name) == 0) {
        return false;
    }
    order_.erase(std::remove(order_.begin(), order_.end(), name), order_.end());
    spdlog::info("Unregistered tool: {}", name);
    return true;
}

std::optional<ToolInfo> ToolRegistry::get_tool(const std::string& name) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return std::nullopt;
    }
    return it->second.info;
}

json ToolRegistry::list_tools() const {
    json tools_array = json::array();
    for (const auto& name : order_) {
        tools_array.push_back(tools_.at(name).info.to_json());
    }
    return tools_array;
}

json ToolRegistry::error_result(const std::string& text) {
    return {
        {"content", text_content(text)},
        {"isError", true}
    };
}

json ToolRegistry::normalize_result(const json& raw) {
    if (raw.is_string()) {
        return {{"content", text_content(raw.get<std::string>())}};
    }
    if (raw.is_object() && raw.contains("content")) {
        return raw;
    }
    if (raw.is_object() || raw.is_array()) {
        return {{"content", text_content(to_text(raw, 2))}};
    }
    return {{"content", text_content(to_text(raw, -1))}};
}

std::future<json> ToolRegistry::call_tool(const std::string& name, const json& arguments) {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        spdlog::warn("Call to unknown tool: {}", name);
        return ready(error_result("Unknown tool: " + name));
    }

    const Entry& entry = it->second;
    spdlog::debug("Calling tool: {} with args: {}", name, to_text(arguments, -1));

    if (entry.sync) {
        try {
            return ready(normalize_result(entry.sync(arguments)));
        } catch (const std::exception& e) {
            spdlog::error("Tool {} failed: {}", name, e.what());
            return ready(error_result(std::string("Error: ") + e.what()));
        }
    }

    std::future<json> pending;
    try {
        pending = entry.async(arguments);
    } catch (const std::exception& e) {
        spdlog::error("Tool {} failed to start: {}", name, e.what());
        return ready(error_result(std::string("Error: ") + e.what()));
    }

    // Normalization runs in whichever thread collects the result
    return std::async(std::launch::deferred,
        [name, pending = std::move(pending)]() mutable -> json {
            try {
                return normalize_result(pending.get());
            } catch (const std::exception& e) {
                spdlog::error("Tool {} failed: {}", name, e.what());
                return error_result(std::string("Error: ") + e.what());
            }
        });
}

} // namespace quirk_mcp
