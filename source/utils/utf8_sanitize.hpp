#ifndef CRMCPS_UTF8_SANITIZE_HPP
#define CRMCPS_UTF8_SANITIZE_HPP

// UTF-8 hygiene for bytes read from stdin. nlohmann/json rejects invalid
// UTF-8 while parsing, so incoming frames are repaired before parsing and a
// stray byte costs one U+FFFD instead of the whole request.

#include <cstddef>
#include <string>

namespace utf8_sanitize {

// Replaces invalid UTF-8 sequences (bad lead bytes, truncated or overlong
// sequences, surrogates, code points above U+10FFFF) with U+FFFD. In place.
void sanitize(std::string &text);

// Same, returning a new string.
std::string sanitize(const std::string &text);

// True if text is well-formed UTF-8.
bool is_valid(const std::string &text);

// Number of code points; each invalid byte counts as one.
std::size_t count_code_points(const std::string &text);

} // namespace utf8_sanitize

#endif // CRMCPS_UTF8_SANITIZE_HPP
