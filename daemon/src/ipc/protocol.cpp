/**
 * @file protocol.cpp
 * @brief Request/response serialization
 */

#include "wardend/ipc/protocol.h"
#include "wardend/logger.h"

namespace wardend {

std::optional<Request> Request::parse(const std::string& raw) {
    json parsed = json::parse(raw, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        LOG_DEBUG("Protocol", "Request is not a JSON object");
        return std::nullopt;
    }
    
    auto method = parsed.find("method");
    if (method == parsed.end() || !method->is_string()) {
        LOG_DEBUG("Protocol", "Request has no method");
        return std::nullopt;
    }
    
    Request request;
    request.method = method->get<std::string>();
    request.params = parsed.value("params", json::object());
    if (!request.params.is_object()) {
        return std::nullopt;
    }
    
    auto id = parsed.find("id");
    if (id != parsed.end()) {
        if (id->is_string()) {
            request.id = id->get<std::string>();
        } else if (id->is_number_integer()) {
            request.id = std::to_string(id->get<long long>());
        }
    }
    return request;
}

std::string Request::to_json() const {
    json j = {
        {"method", method},
        {"params", params.is_null() ? json::object() : params}
    };
    if (id) {
        j["id"] = *id;
    }
    return j.dump();
}

std::string Response::to_json() const {
    json j;
    j["success"] = success;
    j["timestamp"] = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    if (success) {
        j["result"] = result;
    } else {
        j["error"] = {
            {"message", error},
            {"code", error_code}
        };
    }
    return j.dump();
}

Response Response::ok(json result) {
    Response response;
    response.success = true;
    response.result = std::move(result);
    return response;
}

Response Response::err(const std::string& message, int code) {
    Response response;
    response.success = false;
    response.error = message;
    response.error_code = code;
    return response;
}

} // namespace wardend
