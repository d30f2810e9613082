#ifndef CRMCPS_JSON_RPC_HPP
#define CRMCPS_JSON_RPC_HPP

// JSON-RPC 2.0 helpers for MCP protocol communication.
// Envelope checks and response builders; every dispatched reply is built here.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response. error_data is attached only when it is not null.
json build_error_response(const json &request_id, int error_code, const std::string &error_message,
                          const json &error_data = nullptr);

// Response for bytes that could not be parsed as JSON (id is always null).
json build_parse_error(const std::string &detail);

// Checks the request envelope: an object with "jsonrpc": "2.0", a string "method",
// and, when present, an "id" that is a string, number or null. On failure fills problem and returns false.
bool validate_envelope(const json &message, std::string &problem);

// Extract method name from a JSON-RPC request/notification. Returns empty if missing.
std::string get_method(const json &message);

// Extract the id from a JSON-RPC message. Returns nullptr json if missing (notification).
json get_id(const json &message);

// Extract params from a JSON-RPC message. Returns empty object if missing.
json get_params(const json &message);

// Check if a message is a notification (no id field).
bool is_notification(const json &message);

} // namespace json_rpc

#endif // CRMCPS_JSON_RPC_HPP
