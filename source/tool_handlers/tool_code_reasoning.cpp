#include "tool_handlers/tool_code_reasoning.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "reasoning/reasoning_engine.hpp"
#include "reasoning/step_validator.hpp"
#include "utils/debug_log.hpp"

#include <string>

// Tool handler for "code-reasoning".
// Feeds the arguments to the reasoning engine and returns its response object
// as pretty-printed JSON text.

namespace tool_code_reasoning {

static const char *kToolDescription =
    "A reflective problem-solving tool with sequential thinking.\n"
    "\n"
    "- Break down tasks into numbered thoughts that can BRANCH or REVISE until a conclusion is reached.\n"
    "- Always set 'next_thought_needed' = false when no further reasoning is needed.\n"
    "\n"
    "Recommended checklist every 3 thoughts:\n"
    "1. Need to BRANCH?   -> set 'branch_from_thought' + 'branch_id'.\n"
    "2. Need to REVISE?   -> set 'is_revision' + 'revises_thought'.\n"
    "3. Scope changed?    -> bump 'total_thoughts'.\n"
    "\n"
    "End each thought with: \"What am I missing?\"";

json build_input_schema() {
    json positive_integer = {{"type", "integer"}, {"minimum", 1}};

    json input_schema;
    input_schema["$schema"] = "http://json-schema.org/draft-07/schema#";
    input_schema["title"] = "ThoughtDataInput";
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"][step_validator::kKeyThought] = {{"type", "string"}, {"minLength", 1}};
    input_schema["properties"][step_validator::kKeyThoughtNumber] = positive_integer;
    input_schema["properties"][step_validator::kKeyTotalThoughts] = positive_integer;
    input_schema["properties"][step_validator::kKeyNextThoughtNeeded] = {{"type", "boolean"}};
    input_schema["properties"][step_validator::kKeyIsRevision] = {{"type", "boolean"}};
    input_schema["properties"][step_validator::kKeyRevisesThought] = positive_integer;
    input_schema["properties"][step_validator::kKeyBranchFromThought] = positive_integer;
    input_schema["properties"][step_validator::kKeyBranchId] = {{"type", "string"}, {"minLength", 1}};
    input_schema["properties"][step_validator::kKeyNeedsMoreThoughts] = {{"type", "boolean"}};
    input_schema["required"] = json::array({
        step_validator::kKeyThought,
        step_validator::kKeyThoughtNumber,
        step_validator::kKeyTotalThoughts,
        step_validator::kKeyNextThoughtNeeded
    });
    input_schema["additionalProperties"] = false;
    return input_schema;
}

json handle_call(reasoning_engine::ReasoningEngine &engine, const json &arguments) {
    reasoning_engine::ProcessResult outcome = engine.process(arguments);
    std::string text = outcome.response.dump(2, ' ', false, json::error_handler_t::replace);
    return mcp_tools::build_text_result(text, outcome.is_error());
}

void register_tool(reasoning_engine::ReasoningEngine &engine) {
    mcp_tools::register_tool({
        kToolName,
        kToolDescription,
        build_input_schema(),
        [&engine](const json &arguments) { return handle_call(engine, arguments); }
    });
    debug_log::log("Registered tool: " + std::string(kToolName));
}

} // namespace tool_code_reasoning
