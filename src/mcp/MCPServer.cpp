#include "MCPServer.hpp"
#include "Errors.hpp"
#include "ProtocolCodec.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace quirk_mcp {

MCPServer::MCPServer(std::unique_ptr<ITransport> transport,
                     ServerConfig config,
                     std::shared_ptr<IToolRegistry> tools)
    : transport_(std::move(transport)),
      config_(std::move(config)),
      lifecycle_(config_.strict_handshake),
      bridge_(std::move(tools)),
      dispatcher_(handlers_) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }

    register_core_handlers();
    spdlog::info("MCPServer initialized ({} v{}, tools {})",
                 config_.name, config_.version, bridge_.has_tools() ? "enabled" : "disabled");
}

void MCPServer::register_core_handlers() {
    handlers_.register_sync(methods::kInitialize,
        [this](const json& params) { return handle_initialize(params); });
    handlers_.register_sync(methods::kInitialized,
        [this](const json& params) { return handle_initialized_notification(params); });
    handlers_.register_sync(methods::kShutdown,
        [this](const json& params) { return handle_shutdown(params); });
    handlers_.register_sync(methods::kPing,
        [](const json&) { return json::object(); });
    handlers_.register_sync(methods::kCancelled,
        [this](const json& params) { return handle_cancelled_notification(params); });

    bridge_.register_with(handlers_);
}

bool MCPServer::run() {
    running_ = true;
    spdlog::info("MCPServer starting main loop");

    bool clean = true;
    while (running_ && transport_->is_open()) {
        try {
            std::optional<std::string> payload = transport_->read_message();

            // No payload means the host closed the stream
            if (!payload) {
                spdlog::info("End of input stream, stopping server");
                break;
            }

            std::optional<std::string> reply = process_message(*payload);

            // Notifications produce no reply
            if (reply) {
                transport_->write_message(*reply);
            }

        } catch (const FramingError& e) {
            spdlog::error("Transport failure, stopping server: {}", e.what());
            clean = false;
            break;
        }
    }

    lifecycle_.on_end_of_stream();
    running_ = false;
    spdlog::info("MCPServer stopped");
    return clean;
}

void MCPServer::stop() {
    running_ = false;
}

std::optional<std::string> MCPServer::process_message(const std::string& payload) {
    Request request;
    try {
        request = ProtocolCodec::parse_request(payload);
    } catch (const MalformedPayload& e) {
        spdlog::warn("Rejected payload: {}", e.what());
        return ProtocolCodec::serialize_response(
            Dispatcher::error_response(e.id(), e.code(), e.what()));
    }

    spdlog::debug("Received: {}", request.method);

    if (!lifecycle_.permits(request.method)) {
        spdlog::warn("Method {} not permitted in state {}",
                     request.method, to_string(lifecycle_.state()));
        if (request.is_notification()) {
            return std::nullopt;
        }
        return ProtocolCodec::serialize_response(Dispatcher::error_response(
            *request.id, ErrorCode::InvalidRequest,
            "Invalid Request: " + request.method + " not permitted in session state " +
                to_string(lifecycle_.state()),
            json{{"state", to_string(lifecycle_.state())}}));
    }

    std::optional<Response> response = dispatcher_.handle(request);
    if (!response) {
        return std::nullopt;
    }
    return ProtocolCodec::serialize_response(*response);
}

json MCPServer::capabilities() const {
    json caps = json::object();
    if (bridge_.has_tools()) {
        caps["tools"] = json::object();
    }
    return caps;
}

json MCPServer::handle_initialize(const json& params) {
    spdlog::info("Handling initialize request");

    // Extract client info if provided
    auto client_info = params.find("clientInfo");
    if (client_info != params.end() && client_info->is_object()) {
        std::string client_name = client_info->value("name", "unknown");
        std::string client_version = client_info->value("version", "unknown");
        spdlog::info("Client: {} version {}", client_name, client_version);
    }
    auto requested = params.find("protocolVersion");
    if (requested != params.end() && requested->is_string()) {
        spdlog::debug("Client requested protocol {}", requested->get<std::string>());
    }

    lifecycle_.on_initialize();

    return {
        {"protocolVersion", kMcpProtocolVersion},
        {"capabilities", capabilities()},
        {"serverInfo", {
            {"name", config_.name},
            {"version", config_.version}
        }}
    };
}

json MCPServer::handle_initialized_notification(const json& /*params*/) {
    spdlog::info("Client sent initialized notification, server is ready");
    lifecycle_.on_initialized();
    return json::object();
}

json MCPServer::handle_shutdown(const json& /*params*/) {
    spdlog::info("Shutdown requested");
    lifecycle_.on_shutdown();
    running_ = false;
    return json::object();
}

json MCPServer::handle_cancelled_notification(const json& params) {
    // Requests are handled one at a time, so the target has already completed
    spdlog::debug("Ignoring cancellation for request {}", params.value("requestId", json()).dump());
    return json::object();
}

} // namespace quirk_mcp
