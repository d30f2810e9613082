#include "utils/config.hpp"

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdlib>

namespace config {

static std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

bool is_truthy(const std::string &value) {
    std::string normalized = to_lower(value);
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

bool parse_positive_integer(const std::string &text, int &output) {
    if (text.empty() || text.size() > 10) {
        return false;
    }
    long long value = 0;
    for (char character : text) {
        if (!std::isdigit(static_cast<unsigned char>(character))) {
            return false;
        }
        value = value * 10 + (character - '0');
    }
    if (value <= 0 || value > INT_MAX) {
        return false;
    }
    output = static_cast<int>(value);
    return true;
}

// Applies one numeric setting by name. Returns false with error_message set on a bad value.
static bool apply_number(const std::string &source, const std::string &value, int &target,
                         std::string &error_message) {
    int parsed = 0;
    if (!parse_positive_integer(value, parsed)) {
        error_message = "Invalid value for " + source + ": '" + value + "' (expected a positive integer)";
        return false;
    }
    target = parsed;
    return true;
}

LoadResult load(const std::vector<std::string> &arguments, const EnvironmentLookup &environment) {
    LoadResult result;
    Config &loaded = result.config;
    int max_thought_length = static_cast<int>(loaded.max_thought_length);

    struct NumericSetting {
        const char *environment_name;
        const char *flag_name;
        int *target;
    };
    const NumericSetting numeric_settings[] = {
        {"CRMCPS_MAX_THOUGHT_LENGTH", "--max-thought-length", &max_thought_length},
        {"CRMCPS_MAX_THOUGHTS", "--max-thoughts", &loaded.max_thoughts},
        {"CRMCPS_TIMEOUT_MS", "--timeout-ms", &loaded.timeout_ms},
    };

    // Environment.
    for (const auto &setting : numeric_settings) {
        const char *value = environment(setting.environment_name);
        if (value == nullptr || value[0] == '\0') {
            continue;
        }
        if (!apply_number(setting.environment_name, value, *setting.target, result.error_message)) {
            return result;
        }
    }
    const char *debug_value = environment("CRMCPS_DEBUG");
    if (debug_value != nullptr && is_truthy(debug_value)) {
        loaded.debug = true;
    }

    // Command line.
    for (const auto &argument : arguments) {
        if (argument == "--debug") {
            loaded.debug = true;
            continue;
        }
        if (argument == "--help" || argument == "-h") {
            result.show_help = true;
            continue;
        }

        bool matched = false;
        for (const auto &setting : numeric_settings) {
            std::string prefix = std::string(setting.flag_name) + "=";
            if (argument.compare(0, prefix.size(), prefix) == 0) {
                matched = true;
                if (!apply_number(setting.flag_name, argument.substr(prefix.size()), *setting.target,
                                  result.error_message)) {
                    return result;
                }
                break;
            }
        }
        if (!matched) {
            result.error_message = "Unknown argument: " + argument;
            return result;
        }
    }

    loaded.max_thought_length = static_cast<std::size_t>(max_thought_length);
    result.success = true;
    return result;
}

LoadResult load(int argc, char **argv) {
    std::vector<std::string> arguments;
    for (int index = 1; index < argc; index++) {
        arguments.emplace_back(argv[index]);
    }
    return load(arguments, [](const char *name) { return std::getenv(name); });
}

std::string usage() {
    return "Usage: crmcps [options]\n"
           "\n"
           "Code reasoning MCP server. Speaks JSON-RPC 2.0 on stdin/stdout.\n"
           "\n"
           "Options:\n"
           "  --debug                   Verbose logging to stderr (also CRMCPS_DEBUG=1)\n"
           "  --max-thought-length=N    Max characters per thought (CRMCPS_MAX_THOUGHT_LENGTH, default 20000)\n"
           "  --max-thoughts=N          Max thought_number before aborting (CRMCPS_MAX_THOUGHTS, default 20)\n"
           "  --timeout-ms=N            Log calls slower than N ms (CRMCPS_TIMEOUT_MS, default 30000)\n"
           "  -h, --help                Show this help and exit\n";
}

} // namespace config
