#include "utils/utf8_sanitize.hpp"

namespace utf8_sanitize {

namespace {

const char kReplacement[] = "\xEF\xBF\xBD"; // U+FFFD

// Length of the well-formed sequence starting at data[0], or 0 if it is malformed.
// Follows the well-formed byte sequence table of Unicode (Table 3-7).
std::size_t sequence_length(const unsigned char *data, std::size_t available) {
    unsigned char lead = data[0];
    if (lead < 0x80u) {
        return 1;
    }

    std::size_t length = 0;
    unsigned char second_low = 0x80u;
    unsigned char second_high = 0xBFu;

    if (lead >= 0xC2u && lead <= 0xDFu) {
        length = 2;
    } else if (lead >= 0xE0u && lead <= 0xEFu) {
        length = 3;
        if (lead == 0xE0u) {
            second_low = 0xA0u;  // overlong
        } else if (lead == 0xEDu) {
            second_high = 0x9Fu; // surrogates
        }
    } else if (lead >= 0xF0u && lead <= 0xF4u) {
        length = 4;
        if (lead == 0xF0u) {
            second_low = 0x90u;  // overlong
        } else if (lead == 0xF4u) {
            second_high = 0x8Fu; // above U+10FFFF
        }
    } else {
        return 0;
    }

    if (available < length) {
        return 0;
    }
    if (data[1] < second_low || data[1] > second_high) {
        return 0;
    }
    for (std::size_t offset = 2; offset < length; ++offset) {
        if ((data[offset] & 0xC0u) != 0x80u) {
            return 0;
        }
    }
    return length;
}

} // namespace

void sanitize(std::string &text) {
    if (is_valid(text)) {
        return;
    }

    std::string result;
    result.reserve(text.size() + 8);

    const unsigned char *data = reinterpret_cast<const unsigned char *>(text.data());
    std::size_t position = 0;
    while (position < text.size()) {
        std::size_t length = sequence_length(data + position, text.size() - position);
        if (length == 0) {
            result.append(kReplacement, sizeof(kReplacement) - 1);
            ++position;
            continue;
        }
        result.append(text, position, length);
        position += length;
    }

    text.swap(result);
}

std::string sanitize(const std::string &text) {
    std::string copy = text;
    sanitize(copy);
    return copy;
}

bool is_valid(const std::string &text) {
    const unsigned char *data = reinterpret_cast<const unsigned char *>(text.data());
    std::size_t position = 0;
    while (position < text.size()) {
        std::size_t length = sequence_length(data + position, text.size() - position);
        if (length == 0) {
            return false;
        }
        position += length;
    }
    return true;
}

std::size_t count_code_points(const std::string &text) {
    const unsigned char *data = reinterpret_cast<const unsigned char *>(text.data());
    std::size_t count = 0;
    std::size_t position = 0;
    while (position < text.size()) {
        std::size_t length = sequence_length(data + position, text.size() - position);
        position += (length == 0) ? 1 : length;
        ++count;
    }
    return count;
}

} // namespace utf8_sanitize
