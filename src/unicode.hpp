#pragma once

/**
 * Unicode helpers for measuring how wide text appears on a terminal.
 */

#include <cstddef>
#include <string>

namespace fsays {
namespace unicode {

/**
 * Get the terminal column width of a single code point.
 * Returns 0 for control characters and combining marks, 2 for East Asian
 * wide and fullwidth characters, 1 otherwise.
 */
int char_width(char32_t cp);

/**
 * Decode a UTF-8 string into code points.
 * Each byte of an invalid sequence (overlong, surrogate, out of range,
 * truncated) decodes to U+FFFD.
 */
std::u32string decode_utf8(const std::string& text);

/**
 * Calculate the display width of a UTF-8 string: the sum of char_width()
 * over its code points. Not the byte length, not the code point count.
 *
 * @param text The text to measure
 * @return Display width in columns
 */
std::size_t display_width(const std::string& text);

} // namespace unicode
} // namespace fsays
