#include "protocol/json_rpc.hpp"

namespace json_rpc {

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message,
                          const json &error_data) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    if (!error_data.is_null()) {
        response["error"]["data"] = error_data;
    }
    return response;
}

json build_parse_error(const std::string &detail) {
    json data;
    data["detail"] = detail;
    return build_error_response(nullptr, PARSE_ERROR, "Parse error", data);
}

bool validate_envelope(const json &message, std::string &problem) {
    if (!message.is_object()) {
        problem = "expected a JSON-RPC object";
        return false;
    }
    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        problem = "'jsonrpc' must be \"2.0\"";
        return false;
    }
    if (!message.contains("method") || !message["method"].is_string()) {
        problem = "missing or invalid 'method'";
        return false;
    }
    if (message.contains("id")) {
        const json &id = message["id"];
        if (!id.is_string() && !id.is_number() && !id.is_null()) {
            problem = "'id' must be a string, number or null";
            return false;
        }
    }
    return true;
}

std::string get_method(const json &message) {
    if (message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "";
}

json get_id(const json &message) {
    if (message.contains("id")) {
        return message["id"];
    }
    return nullptr;
}

json get_params(const json &message) {
    if (message.contains("params") && message["params"].is_object()) {
        return message["params"];
    }
    return json::object();
}

bool is_notification(const json &message) {
    return !message.contains("id");
}

} // namespace json_rpc
