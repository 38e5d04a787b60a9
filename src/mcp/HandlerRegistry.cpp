#include "HandlerRegistry.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace quirk_mcp {

namespace {

bool is_empty(const Handler& handler) {
    return std::visit([](const auto& fn) { return !fn; }, handler);
}

} // namespace

void HandlerRegistry::register_handler(const std::string& method, Handler handler) {
    if (method.empty()) {
        throw std::invalid_argument("Method name cannot be empty");
    }
    if (is_empty(handler)) {
        throw std::invalid_argument("Handler for " + method + " cannot be null");
    }

    auto [it, inserted] = handlers_.insert_or_assign(method, std::move(handler));
    if (inserted) {
        spdlog::debug("Registered handler: {}", it->first);
    } else {
        spdlog::debug("Replaced handler: {}", it->first);
    }
}

void HandlerRegistry::register_sync(const std::string& method, SyncHandler handler) {
    register_handler(method, Handler(std::in_place_type<SyncHandler>, std::move(handler)));
}

void HandlerRegistry::register_async(const std::string& method, AsyncHandler handler) {
    register_handler(method, Handler(std::in_place_type<AsyncHandler>, std::move(handler)));
}

bool HandlerRegistry::unregister_handler(const std::string& method) {
    return handlers_.erase(method) > 0;
}

const Handler* HandlerRegistry::get(const std::string& method) const {
    auto it = handlers_.find(method);
    return it == handlers_.end() ? nullptr : &it->second;
}

bool HandlerRegistry::contains(const std::string& method) const {
    return handlers_.count(method) > 0;
}

std::vector<std::string> HandlerRegistry::methods() const {
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& [name, handler] : handlers_) {
        names.push_back(name);
    }
    return names;
}

} // namespace quirk_mcp
