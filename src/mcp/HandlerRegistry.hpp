#pragma once

#include <functional>
#include <future>
#include <map>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace quirk_mcp {

using json = nlohmann::ordered_json;

/**
 * @brief Handler that computes its result immediately
 * @param params Request params (always an object)
 */
using SyncHandler = std::function<json(const json& params)>;

/**
 * @brief Handler that completes later
 *
 * The dispatcher waits on the returned future before reading the next message.
 */
using AsyncHandler = std::function<std::future<json>(const json& params)>;

/**
 * @brief Tagged handler: the dispatcher never has to guess which kind it holds
 */
using Handler = std::variant<SyncHandler, AsyncHandler>;

/**
 * @brief Method name to handler mapping
 *
 * Registering an existing method replaces the previous handler.
 * Mutated only from the thread running the dispatch loop.
 */
class HandlerRegistry {
public:
    /**
     * @brief Register handler for method (last registration wins)
     * @throws std::invalid_argument on empty method name or empty handler
     */
    void register_handler(const std::string& method, Handler handler);

    void register_sync(const std::string& method, SyncHandler handler);
    void register_async(const std::string& method, AsyncHandler handler);

    /**
     * @brief Remove handler for method
     * @return true if a handler was registered
     */
    bool unregister_handler(const std::string& method);

    /**
     * @brief Look up handler for method
     * @return Pointer to handler, nullptr if none; invalidated by register/unregister
     */
    const Handler* get(const std::string& method) const;

    bool contains(const std::string& method) const;
    std::vector<std::string> methods() const;
    std::size_t size() const { return handlers_.size(); }

private:
    std::map<std::string, Handler> handlers_;
};

} // namespace quirk_mcp
