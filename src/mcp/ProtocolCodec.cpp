#include "ProtocolCodec.hpp"

namespace quirk_mcp {

namespace {

constexpr const char* kVersionField = "protocolVersion";
constexpr const char* kLegacyVersionField = "jsonrpc";

bool is_valid_id(const json& id) {
    return id.is_number_integer() || id.is_string();
}

} // namespace

json ErrorObject::to_json() const {
    json error = {
        {"code", code},
        {"message", message}
    };
    if (data.has_value()) {
        error["data"] = *data;
    }
    return error;
}

Response Response::success(json id, json result) {
    Response response;
    response.id = std::move(id);
    response.result = std::move(result);
    return response;
}

Response Response::failure(json id, ErrorObject error) {
    Response response;
    response.id = std::move(id);
    response.error = std::move(error);
    return response;
}

json ProtocolCodec::recover_id(const json& payload) {
    if (payload.is_object()) {
        auto it = payload.find("id");
        if (it != payload.end() && is_valid_id(*it)) {
            return *it;
        }
    }
    return nullptr;
}

Request ProtocolCodec::parse_request(const std::string& text) {
    json payload;
    try {
        payload = json::parse(text);
    } catch (const json::parse_error& e) {
        throw MalformedPayload(ErrorCode::ParseError, std::string("Parse error: ") + e.what());
    }

    if (!payload.is_object()) {
        throw MalformedPayload(ErrorCode::InvalidRequest,
            "Invalid Request: payload must be a JSON object");
    }

    const json id = recover_id(payload);

    auto version = payload.find(kVersionField);
    if (version == payload.end()) {
        version = payload.find(kLegacyVersionField);
    }
    if (version == payload.end()) {
        throw MalformedPayload(ErrorCode::InvalidRequest,
            "Invalid Request: missing protocolVersion field", id);
    }
    if (!version->is_string() || version->get<std::string>() != kEnvelopeVersion) {
        throw MalformedPayload(ErrorCode::InvalidRequest,
            "Invalid Request: unsupported protocol version " + version->dump(), id);
    }

    auto method = payload.find("method");
    if (method == payload.end()) {
        throw MalformedPayload(ErrorCode::InvalidRequest,
            "Invalid Request: missing method field", id);
    }
    if (!method->is_string()) {
        throw MalformedPayload(ErrorCode::InvalidRequest,
            "Invalid Request: method must be a string", id);
    }

    Request request;
    request.method = method->get<std::string>();

    auto id_node = payload.find("id");
    if (id_node != payload.end() && !id_node->is_null()) {
        if (!is_valid_id(*id_node)) {
            throw MalformedPayload(ErrorCode::InvalidRequest,
                "Invalid Request: id must be an integer or string");
        }
        request.id = *id_node;
    }

    auto params = payload.find("params");
    if (params != payload.end() && !params->is_null()) {
        if (!params->is_object()) {
            throw MalformedPayload(ErrorCode::InvalidRequest,
                "Invalid Request: params must be an object", id);
        }
        request.params = *params;
    }

    return request;
}

json ProtocolCodec::to_json(const Response& response) {
    json message = json::object();
    message[kVersionField] = kEnvelopeVersion;
    message["id"] = response.id;
    if (response.error.has_value()) {
        message["error"] = response.error->to_json();
    } else {
        message["result"] = response.result.value_or(json::object());
    }
    return message;
}

std::string ProtocolCodec::serialize_response(const Response& response) {
    return to_json(response).dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace quirk_mcp
