// CRMCPS – Code Reasoning Model Context Protocol Server
// Entry point: stdio MCP server loop.
//
// Reads JSON-RPC 2.0 messages from stdin, dispatches them, writes responses to stdout.
// Logs go to stderr (permitted by the MCP stdio transport). stdout only ever carries protocol frames.

#include <nlohmann/json.hpp>
#include <exception>
#include <iostream>
#include <string>

#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_tools.hpp"
#include "mcp/stdout_guard.hpp"
#include "protocol/json_rpc.hpp"
#include "reasoning/reasoning_engine.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/config.hpp"
#include "utils/debug_log.hpp"
#include "utils/shutdown_signal.hpp"
#include "utils/utf8_sanitize.hpp"

using json = nlohmann::json;

static void serve(reasoning_engine::ReasoningEngine &engine) {
    tool_handlers::register_all_tools(engine);
    debug_log::info("Code Reasoning MCP Server ready. Waiting for MCP messages on stdin.");

    // Main message loop: read from stdin, dispatch, write to stdout.
    while (!shutdown_signal::requested()) {
        std::string raw_message = mcp_stdio::read_message();

        if (raw_message.empty()) {
            // An interrupted read also ends here.
            if (shutdown_signal::requested()) {
                debug_log::info("Shutdown signal received. Shutting down.");
            } else {
                debug_log::info("EOF on stdin. Shutting down.");
            }
            break;
        }

        utf8_sanitize::sanitize(raw_message);

        json parsed_message;
        try {
            parsed_message = json::parse(raw_message);
        } catch (const json::parse_error &error) {
            debug_log::error("Failed to parse incoming JSON", json{{"error", error.what()}});
            mcp_stdio::write_frame(json_rpc::build_parse_error(error.what()));
            continue;
        }

        json response = mcp_dispatch::dispatch_message(parsed_message);

        // Notifications return null (no response needed).
        if (response.is_null()) {
            continue;
        }

        mcp_stdio::write_frame(response);
    }

    // Registered handlers hold a reference to the engine.
    mcp_tools::clear_registered_tools();
}

int main(int argc, char **argv) {
    config::LoadResult loaded = config::load(argc, argv);
    if (!loaded.success) {
        std::cerr << "[crmcps] " << loaded.error_message << "\n\n" << config::usage();
        return 2;
    }
    if (loaded.show_help) {
        std::cerr << config::usage();
        return 0;
    }
    if (loaded.config.debug) {
        debug_log::set_debug_enabled(true);
    }

    std::cerr << "[crmcps] crmcps – Code Reasoning MCP Server, build " << __DATE__ << " " << __TIME__ << std::endl;

    if (!shutdown_signal::install_handlers()) {
        debug_log::error("Cannot install SIGINT/SIGTERM handlers; stop the server by closing stdin");
    }

    try {
        stdout_guard::ScopedStdoutGuard output_guard;
        reasoning_engine::ReasoningEngine engine(loaded.config);
        serve(engine);

        debug_log::log("Discarded non-protocol stdout writes: " +
                       std::to_string(output_guard.discarded_count()));
    } catch (const std::exception &error) {
        debug_log::error("Fatal error", json{{"error", error.what()}});
        return 1;
    }

    debug_log::info("Code Reasoning MCP Server shut down.");
    return 0;
}
