#include "Dispatcher.hpp"
#include <spdlog/spdlog.h>

namespace quirk_mcp {

Dispatcher::Dispatcher(const HandlerRegistry& registry)
    : registry_(registry) {}

Response Dispatcher::error_response(const json& id, ErrorCode code, const std::string& message,
                                    std::optional<json> data) {
    return Response::failure(id, ErrorObject{to_int(code), message, std::move(data)});
}

json Dispatcher::invoke(const Handler& handler, const json& params) const {
    if (const auto* sync = std::get_if<SyncHandler>(&handler)) {
        return (*sync)(params);
    }

    std::future<json> pending = std::get<AsyncHandler>(handler)(params);
    return pending.get();
}

std::optional<Response> Dispatcher::handle(const Request& request) const {
    const json id = request.id.value_or(json(nullptr));
    const Handler* handler = registry_.get(request.method);

    if (handler == nullptr) {
        if (request.is_notification()) {
            spdlog::debug("Ignoring notification without handler: {}", request.method);
            return std::nullopt;
        }
        return error_response(id, ErrorCode::MethodNotFound, "Method not found: " + request.method);
    }

    spdlog::debug("Handling request: method={}, id={}", request.method, id.dump());

    Response response;
    try {
        response = Response::success(id, invoke(*handler, request.params));
    } catch (const InvalidParams& e) {
        spdlog::warn("Invalid params for {}: {}", request.method, e.what());
        response = error_response(id, ErrorCode::InvalidParams, std::string("Invalid params: ") + e.what());
    } catch (const nlohmann::json::type_error& e) {
        // Params field of the wrong JSON type
        spdlog::warn("Invalid params for {}: {}", request.method, e.what());
        response = error_response(id, ErrorCode::InvalidParams, std::string("Invalid params: ") + e.what());
    } catch (const nlohmann::json::out_of_range& e) {
        // Required params field missing
        spdlog::warn("Invalid params for {}: {}", request.method, e.what());
        response = error_response(id, ErrorCode::InvalidParams, std::string("Invalid params: ") + e.what());
    } catch (const std::exception& e) {
        spdlog::error("Error handling method {}: {}", request.method, e.what());
        response = error_response(id, ErrorCode::InternalError, std::string("Internal error: ") + e.what());
    } catch (...) {
        spdlog::error("Unknown exception handling method {}", request.method);
        response = error_response(id, ErrorCode::InternalError, "Internal error: unknown exception");
    }

    if (request.is_notification()) {
        if (response.is_error()) {
            spdlog::warn("Notification {} failed: {}", request.method, response.error->message);
        }
        return std::nullopt;
    }
    return response;
}

} // namespace quirk_mcp
