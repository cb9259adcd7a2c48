#include "ipc/protocol.hpp"
#include "util/time.hpp"

namespace royaos::ipc {

using json = nlohmann::json;
using kernel::ErrorKind;
using kernel::KernelError;

json Request::to_json() const {
    json j;
    j["id"] = id;
    j["type"] = type;
    j["parameters"] = parameters;
    j["timestamp"] = timestamp;
    return j;
}

Request Request::from_json(const json& j) {
    if (!j.is_object()) {
        throw KernelError(ErrorKind::INVALID_ARGUMENT, "request must be a JSON object");
    }

    Request req;
    try {
        req.id = j.value("id", "");
        req.type = j.value("type", "");
        req.timestamp = j.value("timestamp", static_cast<uint64_t>(0));
    } catch (const json::exception& e) {
        throw KernelError(ErrorKind::INVALID_ARGUMENT, std::string("malformed request: ") + e.what());
    }
    if (req.type.empty()) {
        throw KernelError(ErrorKind::INVALID_ARGUMENT, "request type is required");
    }

    if (j.contains("parameters") && !j["parameters"].is_null()) {
        if (!j["parameters"].is_object()) {
            throw KernelError(ErrorKind::INVALID_ARGUMENT, "request parameters must be an object");
        }
        req.parameters = j["parameters"];
    }
    return req;
}

Response Response::ok(const std::string& id, json data) {
    Response r;
    r.id = id;
    r.success = true;
    r.data = std::move(data);
    r.timestamp = util::now_millis();
    return r;
}

Response Response::failure(const std::string& id, ErrorKind kind, const std::string& message) {
    Response r;
    r.id = id;
    r.success = false;
    r.error_kind = kind;
    r.error = message;
    r.timestamp = util::now_millis();
    return r;
}

json Response::to_json() const {
    json j;
    j["id"] = id;
    j["success"] = success;
    if (success) {
        j["data"] = data;
    } else {
        j["error"]["kind"] = error_kind ? kernel::error_kind_to_string(*error_kind) : "Unknown";
        j["error"]["message"] = error;
    }
    j["timestamp"] = timestamp;
    return j;
}

} // namespace royaos::ipc
