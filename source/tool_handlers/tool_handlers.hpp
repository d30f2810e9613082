#ifndef CRMCPS_TOOL_HANDLERS_HPP
#define CRMCPS_TOOL_HANDLERS_HPP

// Tool handler registration.
// Each tool_*.cpp file provides a register function that is called during startup.

namespace reasoning_engine {
class ReasoningEngine;
}

namespace tool_handlers {

// Register all available tool handlers with the MCP tool registry.
// The engine must outlive the registry entries.
void register_all_tools(reasoning_engine::ReasoningEngine &engine);

} // namespace tool_handlers

#endif // CRMCPS_TOOL_HANDLERS_HPP
