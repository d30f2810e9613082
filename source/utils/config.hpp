#ifndef CRMCPS_CONFIG_HPP
#define CRMCPS_CONFIG_HPP

// Startup configuration: defaults, then CRMCPS_* environment variables,
// then command-line flags (later sources win).

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace config {

struct Config {
    std::size_t max_thought_length = 20000; // code points per thought
    int max_thoughts = 20;                  // thought_number above this aborts the chain
    int timeout_ms = 30000;                 // calls slower than this are logged as slow
    bool debug = false;
};

struct LoadResult {
    bool success = false;
    bool show_help = false;
    Config config;
    std::string error_message;
};

// Returns the value of an environment variable, or nullptr if unset.
using EnvironmentLookup = std::function<const char *(const char *name)>;

// Load from the process environment and argv (argv[0] is skipped).
LoadResult load(int argc, char **argv);

// Load from explicit arguments (without the program name) and an environment lookup.
LoadResult load(const std::vector<std::string> &arguments, const EnvironmentLookup &environment);

// Usage text for --help.
std::string usage();

// True for 1, true, yes (case-insensitive).
bool is_truthy(const std::string &value);

// Parses a strictly positive decimal integer that fits in an int.
bool parse_positive_integer(const std::string &text, int &output);

} // namespace config

#endif // CRMCPS_CONFIG_HPP
