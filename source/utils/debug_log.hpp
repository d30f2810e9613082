#ifndef CRMCPS_DEBUG_LOG_HPP
#define CRMCPS_DEBUG_LOG_HPP

// stderr logging. stdout is reserved for protocol frames, so nothing here
// ever writes to std::cout.

#include <nlohmann/json.hpp>
#include <string>

namespace debug_log {

using json = nlohmann::json;

// Returns true if debug logging was switched on with set_debug_enabled(), or if the
// CRMCPS_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_enabled();

// Forces debug logging on (used for --debug).
void set_debug_enabled(bool enabled);

// Writes message to stderr with [crmcps] prefix only when is_debug_enabled().
void log(const std::string &message);

// Same, with structured fields appended as compact JSON.
void log(const std::string &message, const json &fields);

// Always written, prefixed with the level (INFO, WARN, ERROR).
void info(const std::string &message, const json &fields = json::object());
void warn(const std::string &message, const json &fields = json::object());
void error(const std::string &message, const json &fields = json::object());

// Builds the line written for a message, without the trailing newline.
// level may be null for plain debug lines.
std::string format_line(const char *level, const std::string &message, const json &fields);

// Writes a multi-line block to stderr as-is (no prefix).
void print_block(const std::string &text);

} // namespace debug_log

#endif // CRMCPS_DEBUG_LOG_HPP
