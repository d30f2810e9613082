#include "utils/debug_log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace debug_log {

static std::atomic<bool> debug_forced{false};
static std::mutex stderr_mutex;

static std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

bool is_debug_enabled() {
    if (debug_forced.load()) {
        return true;
    }
    const char *value = std::getenv("CRMCPS_DEBUG");
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    std::string normalized = to_lower(std::string(value));
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

void set_debug_enabled(bool enabled) {
    debug_forced.store(enabled);
}

std::string format_line(const char *level, const std::string &message, const json &fields) {
    std::string line = "[crmcps] ";
    if (level != nullptr) {
        line += level;
        line += ": ";
    }
    line += message;
    if (fields.is_object() && !fields.empty()) {
        line += " ";
        line += fields.dump(-1, ' ', false, json::error_handler_t::replace);
    }
    return line;
}

static void write_line(const char *level, const std::string &message, const json &fields) {
    std::string line = format_line(level, message, fields);
    std::lock_guard<std::mutex> lock(stderr_mutex);
    std::cerr << line << std::endl;
}

void log(const std::string &message) {
    if (!is_debug_enabled()) {
        return;
    }
    write_line(nullptr, message, json::object());
}

void log(const std::string &message, const json &fields) {
    if (!is_debug_enabled()) {
        return;
    }
    write_line(nullptr, message, fields);
}

void info(const std::string &message, const json &fields) {
    write_line("INFO", message, fields);
}

void warn(const std::string &message, const json &fields) {
    write_line("WARN", message, fields);
}

void error(const std::string &message, const json &fields) {
    write_line("ERROR", message, fields);
}

void print_block(const std::string &text) {
    std::lock_guard<std::mutex> lock(stderr_mutex);
    std::cerr << text << std::endl;
}

} // namespace debug_log
