// Tests for JSON-RPC helpers and MCP method dispatch, with the code-reasoning
// tool registered against a fresh engine.

#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_tools.hpp"
#include "protocol/json_rpc.hpp"
#include "reasoning/reasoning_engine.hpp"
#include "tool_handlers/tool_code_reasoning.hpp"
#include "tool_handlers/tool_handlers.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace test_mcp_dispatch {

static bool check(bool condition, const std::string &test_description) {
    std::cout << (condition ? "  OK: " : "  FAIL: ") << test_description << std::endl;
    return condition;
}

static json request(int id, const std::string &method, const json &params = json::object()) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

static json call_tool(int id, const json &arguments) {
    return request(id, "tools/call", json{{"name", tool_code_reasoning::kToolName}, {"arguments", arguments}});
}

// Parses the JSON text carried by a tool result.
static json tool_payload(const json &response) {
    return json::parse(response["result"]["content"][0]["text"].get<std::string>());
}

// Test: JSON-RPC envelope helpers.
static bool test_json_rpc_helpers() {
    std::string problem;
    bool success = true;
    success &= check(json_rpc::validate_envelope(request(1, "ping"), problem), "Well-formed request accepted");
    success &= check(!json_rpc::validate_envelope(json{{"id", 1}, {"method", "ping"}}, problem),
                     "Missing jsonrpc version rejected");
    success &= check(!json_rpc::validate_envelope(json{{"jsonrpc", "2.0"}, {"id", json::array()}, {"method", "x"}},
                                                  problem),
                     "Array id rejected");

    json error = json_rpc::build_error_response(5, json_rpc::INVALID_PARAMS, "bad");
    success &= check(error["id"] == 5 && error["error"]["code"] == -32602 && !error["error"].contains("data"),
                     "Error response without data");
    json parse_error = json_rpc::build_parse_error("unexpected end");
    success &= check(parse_error["id"].is_null() && parse_error["error"]["code"] == -32700 &&
                     parse_error["error"]["data"]["detail"] == "unexpected end",
                     "Parse error has null id and detail");
    success &= check(json_rpc::is_notification(json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}),
                     "Message without id is a notification");
    return success;
}

// Test: initialize, ping, tools/list.
static bool test_handshake() {
    json initialize = mcp_dispatch::dispatch_message(request(1, "initialize"));
    bool success = check(initialize["result"]["protocolVersion"] == mcp_dispatch::kProtocolVersion &&
                         initialize["result"]["serverInfo"]["name"] == "crmcps" &&
                         initialize["result"]["capabilities"].contains("tools"),
                         "initialize advertises protocol version, server name and tools");

    json ping = mcp_dispatch::dispatch_message(request(2, "ping"));
    success &= check(ping["id"] == 2 && ping["result"] == json::object(), "ping answered with empty result");

    json list = mcp_dispatch::dispatch_message(request(3, "tools/list"));
    const json &tools = list["result"]["tools"];
    success &= check(tools.size() == 1 && tools[0]["name"] == "code-reasoning", "tools/list returns code-reasoning");
    success &= check(tools[0]["inputSchema"]["required"].size() == 4 &&
                     tools[0]["inputSchema"]["properties"].contains("branch_id"),
                     "Input schema lists required keys and optional branch_id");

    json notification = mcp_dispatch::dispatch_message(
        json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    success &= check(notification.is_null(), "Notification yields no response");
    return success;
}

// Test: tools/call routes to the engine and wraps responses as tool results.
static bool test_tools_call(reasoning_engine::ReasoningEngine &engine) {
    json accepted = mcp_dispatch::dispatch_message(call_tool(10, json{
        {"thought", "Start"}, {"thought_number", 1}, {"total_thoughts", 2}, {"next_thought_needed", true}}));
    json accepted_payload = tool_payload(accepted);
    bool success = check(accepted["result"]["isError"] == false && accepted_payload["status"] == "processed",
                         "Valid thought processed through tools/call");
    success &= check(accepted["result"]["content"][0]["text"].get<std::string>().find("\n  \"") != std::string::npos,
                     "Tool result text is pretty-printed");

    json rejected = mcp_dispatch::dispatch_message(call_tool(11, json{{"thought", "no number"}}));
    json rejected_payload = tool_payload(rejected);
    success &= check(rejected["result"]["isError"] == true && rejected_payload["status"] == "failed" &&
                     rejected_payload["field"] == "thought_number",
                     "Invalid thought reported as failed tool result");

    json no_arguments = mcp_dispatch::dispatch_message(
        request(12, "tools/call", json{{"name", "code-reasoning"}}));
    success &= check(tool_payload(no_arguments)["reason"] == "missing_field", "Missing arguments reported");

    success &= check(engine.tracker().summary().history_length == 1, "Only the valid call reached the chain");
    return success;
}

// Test: Protocol-level errors.
static bool test_protocol_errors() {
    json unknown_method = mcp_dispatch::dispatch_message(request(20, "resources/list"));
    bool success = check(unknown_method["error"]["code"] == json_rpc::METHOD_NOT_FOUND,
                         "Unknown method answered with -32601");

    json no_name = mcp_dispatch::dispatch_message(request(21, "tools/call", json{{"arguments", json::object()}}));
    success &= check(no_name["error"]["code"] == json_rpc::INVALID_PARAMS, "tools/call without name is -32602");

    json unknown_tool = mcp_dispatch::dispatch_message(
        request(22, "tools/call", json{{"name", "sequentialthinking"}}));
    success &= check(unknown_tool["result"]["isError"] == true, "Unknown tool yields an error tool result");

    json invalid = mcp_dispatch::dispatch_message(json{{"id", 23}, {"method", "ping"}});
    success &= check(invalid["error"]["code"] == json_rpc::INVALID_REQUEST && invalid["id"] == 23,
                     "Missing jsonrpc version is -32600 with the request id");

    json scalar = mcp_dispatch::dispatch_message(json(42));
    success &= check(scalar["error"]["code"] == json_rpc::INVALID_REQUEST && scalar["id"].is_null(),
                     "Scalar message is -32600 with null id");
    return success;
}

// Test: Batches return one response per request and none for notifications.
static bool test_batch() {
    json batch = json::array({
        request(30, "ping"),
        json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}},
        request(31, "ping")
    });
    json responses = mcp_dispatch::dispatch_message(batch);
    bool success = check(responses.is_array() && responses.size() == 2 &&
                         responses[0]["id"] == 30 && responses[1]["id"] == 31,
                         "Batch answered with two responses in order");

    json only_notifications = mcp_dispatch::dispatch_message(
        json::array({json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}}));
    success &= check(only_notifications.is_null(), "Notification-only batch yields no response");

    json empty = mcp_dispatch::dispatch_message(json::array());
    success &= check(empty["error"]["code"] == json_rpc::INVALID_REQUEST, "Empty batch is -32600");
    return success;
}

bool run_all_tests() {
    config::Config settings;
    reasoning_engine::ReasoningEngine engine(settings);
    mcp_tools::clear_registered_tools();
    tool_handlers::register_all_tools(engine);

    bool all_passed = true;
    all_passed &= test_json_rpc_helpers();
    all_passed &= test_handshake();
    all_passed &= test_tools_call(engine);
    all_passed &= test_protocol_errors();
    all_passed &= test_batch();

    // Registering twice replaces rather than duplicates.
    tool_handlers::register_all_tools(engine);
    all_passed &= check(mcp_tools::get_registered_tools().size() == 1, "Re-registration replaces the tool");

    // A throwing handler becomes an internal error instead of ending the server.
    mcp_tools::register_tool({"always-throws", "Test tool", json{{"type", "object"}},
                              [](const json &) -> json { throw std::runtime_error("boom"); }});
    json failed = mcp_dispatch::dispatch_message(
        json{{"jsonrpc", "2.0"}, {"id", 40}, {"method", "tools/call"}, {"params", {{"name", "always-throws"}}}});
    all_passed &= check(failed["error"]["code"] == json_rpc::INTERNAL_ERROR && failed["id"] == 40,
                        "Throwing tool handler yields -32603");

    mcp_tools::clear_registered_tools();
    return all_passed;
}

} // namespace test_mcp_dispatch
