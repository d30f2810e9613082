#ifndef CRMCPS_TOOL_CODE_REASONING_HPP
#define CRMCPS_TOOL_CODE_REASONING_HPP

#include <nlohmann/json.hpp>

namespace reasoning_engine {
class ReasoningEngine;
}

namespace tool_code_reasoning {

using json = nlohmann::json;

// Name under which the tool is registered.
constexpr const char *kToolName = "code-reasoning";

// JSON Schema of the tool arguments, as advertised in tools/list.
json build_input_schema();

// Run one call against engine and wrap the response object as an MCP tool result.
json handle_call(reasoning_engine::ReasoningEngine &engine, const json &arguments);

void register_tool(reasoning_engine::ReasoningEngine &engine);

} // namespace tool_code_reasoning

#endif // CRMCPS_TOOL_CODE_REASONING_HPP
