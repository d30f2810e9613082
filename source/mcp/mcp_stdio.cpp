#include "mcp/mcp_stdio.hpp"

#include <iostream>
#include <string>

// Uses bracket-counting with string/escape awareness for framing,
// so it works both with newline-delimited and streamed JSON.

namespace mcp_stdio {

// Tracks { } and [ ] depth, respecting strings and escapes.
std::string read_message(std::istream &input) {
    std::string buffer;
    int depth = 0;
    bool inside_string = false;
    bool escape_next = false;
    bool started = false;

    char character;
    while (input.get(character)) {
        if (!started) {
            if (character == '{' || character == '[') {
                started = true;
                depth = 1;
                buffer += character;
            }
            // Ignore anything before the first '{' or '[' (whitespace, newlines, etc.)
            continue;
        }

        buffer += character;

        if (escape_next) {
            escape_next = false;
            continue;
        }

        if (character == '\\' && inside_string) {
            escape_next = true;
            continue;
        }

        if (character == '"') {
            inside_string = !inside_string;
            continue;
        }

        if (inside_string) {
            continue;
        }

        if (character == '{' || character == '[') {
            depth++;
        } else if (character == '}' || character == ']') {
            depth--;
            if (depth == 0) {
                return buffer;
            }
        }
    }

    // EOF reached without a complete message.
    return "";
}

std::string read_message() {
    return read_message(std::cin);
}

void write_message(const std::string &json_string) {
    // One write per frame: the stdout guard judges each write on its own.
    std::string frame_line = json_string + "\n";
    std::cout.write(frame_line.data(), static_cast<std::streamsize>(frame_line.size()));
    std::cout.flush();
}

void write_frame(const json &frame) {
    write_message(frame.dump(-1, ' ', false, json::error_handler_t::replace));
}

} // namespace mcp_stdio
