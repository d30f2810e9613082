#include "mcp/mcp_dispatch.hpp"

#include <exception>
#include <string>

#include "protocol/json_rpc.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

// Routes incoming MCP messages to the appropriate handler.

namespace mcp_dispatch {

// Server info.
static const std::string SERVER_NAME = "crmcps";
static const std::string SERVER_VERSION = "0.1.0";
// Description so that MCP clients can discover what this server is for.
static const std::string SERVER_DESCRIPTION =
    "Code reasoning MCP server: a reflective problem-solving tool for breaking a programming "
    "task into numbered thoughts that can branch and be revised until a conclusion is reached. "
    "Exposes a single tool, code-reasoning.";

// Handle the "initialize" request.
static json handle_initialize(const json &request_id, const json &params) {
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        debug_log::log("initialize from client", params["clientInfo"]);
    }

    json capabilities;
    capabilities["tools"] = json::object(); // We expose tools.

    json server_info;
    server_info["name"] = SERVER_NAME;
    server_info["version"] = SERVER_VERSION;
    server_info["description"] = SERVER_DESCRIPTION;

    json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;

    return json_rpc::build_response(request_id, result);
}

// Handle the "tools/list" request.
static json handle_tools_list(const json &request_id, const json &params) {
    (void)params;
    json result = mcp_tools::build_tools_list_response();
    return json_rpc::build_response(request_id, result);
}

// Handle the "tools/call" request.
static json handle_tools_call(const json &request_id, const json &params) {
    std::string tool_name;
    if (params.contains("name") && params["name"].is_string()) {
        tool_name = params["name"].get<std::string>();
    } else {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                               "Missing or invalid 'name' in tools/call");
    }

    // Non-object arguments are passed through so the tool can report them precisely.
    json arguments = json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        arguments = params["arguments"];
    }

    debug_log::log("Received CallTool request", json{{"tool_name", tool_name}});
    try {
        json tool_result = mcp_tools::dispatch_tool_call(tool_name, arguments);
        return json_rpc::build_response(request_id, tool_result);
    } catch (const std::exception &error) {
        debug_log::error("Tool handler failed", json{{"tool", tool_name}, {"error", error.what()}});
        return json_rpc::build_error_response(request_id, json_rpc::INTERNAL_ERROR,
                                              std::string("Tool '") + tool_name + "' failed: " + error.what());
    }
}

static json dispatch_single(const json &message) {
    std::string problem;
    if (!json_rpc::validate_envelope(message, problem)) {
        json request_id = message.is_object() ? json_rpc::get_id(message) : json(nullptr);
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_REQUEST,
                                               "Invalid Request: " + problem);
    }

    std::string method = json_rpc::get_method(message);
    json request_id = json_rpc::get_id(message);
    json params = json_rpc::get_params(message);

    // Handle notifications (no response expected).
    if (json_rpc::is_notification(message)) {
        // "notifications/initialized" and "notifications/cancelled" need no action.
        debug_log::log("Notification received: " + method);
        return nullptr;
    }

    // Route to the appropriate handler.
    if (method == "initialize") {
        return handle_initialize(request_id, params);
    }
    if (method == "ping") {
        return json_rpc::build_response(request_id, json::object());
    }
    if (method == "tools/list") {
        return handle_tools_list(request_id, params);
    }
    if (method == "tools/call") {
        return handle_tools_call(request_id, params);
    }

    // Unknown method.
    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                           "Unknown method: " + method);
}

json dispatch_message(const json &message) {
    if (!message.is_array()) {
        return dispatch_single(message);
    }

    if (message.empty()) {
        return json_rpc::build_error_response(nullptr, json_rpc::INVALID_REQUEST,
                                               "Invalid Request: empty batch");
    }

    json responses = json::array();
    for (const auto &entry : message) {
        json response = dispatch_single(entry);
        if (!response.is_null()) {
            responses.push_back(response);
        }
    }
    if (responses.empty()) {
        return nullptr;
    }
    return responses;
}

} // namespace mcp_dispatch
