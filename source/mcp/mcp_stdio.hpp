#ifndef CRMCPS_MCP_STDIO_HPP
#define CRMCPS_MCP_STDIO_HPP

// MCP stdio transport: framing of JSON messages on stdin and stdout.

#include <nlohmann/json.hpp>
#include <istream>
#include <string>

namespace mcp_stdio {

using json = nlohmann::json;

// Read a single complete JSON object or array from input.
// Returns the raw JSON text, or an empty string on EOF before a complete message.
std::string read_message(std::istream &input);

// Same, from std::cin.
std::string read_message();

// Write one frame and its newline to stdout as a single write, and flush.
void write_message(const std::string &json_string);

// Serialize and write one frame. Invalid UTF-8 in strings is replaced, never thrown.
void write_frame(const json &frame);

} // namespace mcp_stdio

#endif // CRMCPS_MCP_STDIO_HPP
