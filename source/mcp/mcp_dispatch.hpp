#ifndef CRMCPS_MCP_DISPATCH_HPP
#define CRMCPS_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch.

#include <nlohmann/json.hpp>

namespace mcp_dispatch {

using json = nlohmann::json;

// Protocol version we support.
constexpr const char *kProtocolVersion = "2024-11-05";

// Dispatch a single JSON-RPC message or a batch (array) of messages.
// Returns the response JSON, or a null json value when nothing must be sent
// (notifications, or a batch made only of notifications).
json dispatch_message(const json &message);

} // namespace mcp_dispatch

#endif // CRMCPS_MCP_DISPATCH_HPP
