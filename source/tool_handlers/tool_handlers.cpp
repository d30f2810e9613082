#include "tool_handlers/tool_handlers.hpp"

// Forward declarations of individual tool registration functions.
// Each tool_*.cpp defines its own namespace with a register_tool() function.

namespace tool_code_reasoning { void register_tool(reasoning_engine::ReasoningEngine &engine); }

namespace tool_handlers {

void register_all_tools(reasoning_engine::ReasoningEngine &engine) {
    tool_code_reasoning::register_tool(engine);
}

} // namespace tool_handlers
