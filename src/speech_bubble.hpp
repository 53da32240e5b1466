#pragma once

/**
 * Speech bubble rendering.
 *
 * Draws a message inside an ASCII box sized to the widest wrapped line and
 * appends a mascot:
 *
 *    __________________________
 *   < Hello fellow Rustaceans! >
 *    --------------------------
 *           \
 *            \
 *               _~^~^~_
 *           \) /  o o  \ (/
 *             '_   -   _'
 *             / '-----' \
 *
 * Multi-line messages use "/ \", "| |" and "\ /" for the first, middle and
 * last rows instead of "< >".
 *
 * Usage:
 *   fsays::say("Hello fellow Rustaceans!", 24, std::cout);
 */

#include "mascot.hpp"

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace fsays {

using OutputCallback = std::function<void(const std::string&)>;

/**
 * Draw the box around already wrapped lines and append the mascot.
 * Rows are padded by display width so the right border lines up even with
 * wide or zero-width characters. The bottom border has no line feed of its
 * own; the mascot art supplies it.
 */
std::string render_bubble(const std::vector<std::string>& lines, Mascot mascot);

/**
 * Normalize whitespace, wrap to max_width columns and render the bubble.
 */
std::string format_bubble(const std::string& input, std::size_t max_width,
                          Mascot mascot = default_mascot());

/**
 * Write a speech bubble to a stream in a single write.
 * Throws std::ios_base::failure if the stream rejects the write. The stream
 * is not flushed; that stays with the caller.
 */
void say(const std::string& input, std::size_t max_width, std::ostream& out,
         Mascot mascot = default_mascot());

/**
 * Write a speech bubble through a callback, invoked exactly once.
 * Anything the callback throws propagates unchanged.
 */
void say(const std::string& input, std::size_t max_width, const OutputCallback& output,
         Mascot mascot = default_mascot());

} // namespace fsays
