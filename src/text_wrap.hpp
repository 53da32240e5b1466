#pragma once

/**
 * Whitespace normalization and greedy word wrapping for speech bubbles.
 *
 * Widths are measured in terminal columns (see unicode::display_width), so
 * wide CJK characters take two columns and combining marks take none.
 */

#include <cstddef>
#include <string>
#include <vector>

namespace fsays {

/**
 * Collapse every run of horizontal whitespace into a single ASCII space.
 *
 * Horizontal whitespace is any Unicode White_Space character other than
 * line feed and carriage return (tab, vertical tab, form feed, no-break
 * space, the U+2000 block, ideographic space, ...). Line feeds and carriage
 * returns are copied through and end a run. Nothing is trimmed.
 */
std::string normalize_whitespace(const std::string& text);

/**
 * Wrap text into lines no wider than max_width columns.
 *
 * Each line feed starts a new paragraph, wrapped on its own. Within a
 * paragraph words are separated by ASCII spaces and packed greedily, joined
 * by a single space. A word wider than max_width is not split: it gets a line
 * to itself and that line exceeds max_width.
 *
 * Empty text yields a single empty line. A trailing line feed does not add
 * an empty line at the end.
 */
std::vector<std::string> wrap_lines(const std::string& text, std::size_t max_width);

/**
 * Same as wrap_lines(), with the lines joined by line feeds.
 */
std::string fill(const std::string& text, std::size_t max_width);

} // namespace fsays
