#include "text_wrap.hpp"
#include "unicode.hpp"

namespace fsays {

namespace {
    // Returns the byte length of the horizontal whitespace character starting
    // at pos, or 0 if there is none. Only well-formed UTF-8 sequences match.
    std::size_t horizontal_space_length(const std::string& text, std::size_t pos) {
        auto byte = [&](std::size_t offset) -> unsigned char {
            return pos + offset < text.size()
                ? static_cast<unsigned char>(text[pos + offset]) : 0;
        };

        unsigned char c = byte(0);
        switch (c) {
            case '\t':
            case '\v':
            case '\f':
            case ' ':
                return 1;
            case 0xC2:
                // U+0085 NEXT LINE, U+00A0 NO-BREAK SPACE
                return (byte(1) == 0x85 || byte(1) == 0xA0) ? 2 : 0;
            case 0xE1:
                // U+1680 OGHAM SPACE MARK
                return (byte(1) == 0x9A && byte(2) == 0x80) ? 3 : 0;
            case 0xE2:
                if (byte(1) == 0x80) {
                    unsigned char b = byte(2);
                    // U+2000..U+200A, U+2028, U+2029, U+202F
                    if ((b >= 0x80 && b <= 0x8A) || b == 0xA8 || b == 0xA9 || b == 0xAF) {
                        return 3;
                    }
                    return 0;
                }
                // U+205F MEDIUM MATHEMATICAL SPACE
                return (byte(1) == 0x81 && byte(2) == 0x9F) ? 3 : 0;
            case 0xE3:
                // U+3000 IDEOGRAPHIC SPACE
                return (byte(1) == 0x80 && byte(2) == 0x80) ? 3 : 0;
            default:
                return 0;
        }
    }

    // Greedy fill of a single paragraph (no line feeds inside).
    void wrap_paragraph(const std::string& paragraph, std::size_t max_width,
                        std::vector<std::string>& lines) {
        std::string line;
        std::size_t line_width = 0;
        bool line_has_words = false;

        std::size_t pos = 0;
        while (pos < paragraph.size()) {
            if (paragraph[pos] == ' ') {
                pos++;
                continue;
            }

            std::size_t end = paragraph.find(' ', pos);
            if (end == std::string::npos) {
                end = paragraph.size();
            }
            std::string word = paragraph.substr(pos, end - pos);
            std::size_t word_width = unicode::display_width(word);
            pos = end;

            if (!line_has_words) {
                line = word;
                line_width = word_width;
                line_has_words = true;
            } else if (line_width + 1 + word_width <= max_width) {
                line += ' ';
                line += word;
                line_width += 1 + word_width;
            } else {
                lines.push_back(line);
                line = word;
                line_width = word_width;
            }
        }

        // A paragraph without words still occupies one (empty) line
        lines.push_back(line);
    }
}

std::string normalize_whitespace(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        std::size_t len = horizontal_space_length(text, i);
        if (len == 0) {
            result += text[i];
            i++;
            continue;
        }

        result += ' ';
        while (len > 0) {
            i += len;
            len = horizontal_space_length(text, i);
        }
    }

    return result;
}

std::vector<std::string> wrap_lines(const std::string& text, std::size_t max_width) {
    std::vector<std::string> lines;

    std::size_t start = 0;
    while (true) {
        std::size_t newline = text.find('\n', start);
        std::size_t end = (newline == std::string::npos) ? text.size() : newline;

        std::string paragraph = text.substr(start, end - start);
        // CRLF line endings
        if (newline != std::string::npos && !paragraph.empty() && paragraph.back() == '\r') {
            paragraph.pop_back();
        }
        wrap_paragraph(paragraph, max_width, lines);

        if (newline == std::string::npos) {
            break;
        }
        start = newline + 1;
        if (start == text.size()) {
            // Trailing line feed ends the last line rather than opening a new one
            break;
        }
    }

    return lines;
}

std::string fill(const std::string& text, std::size_t max_width) {
    std::string result;
    std::vector<std::string> lines = wrap_lines(text, max_width);
    for (std::size_t i = 0; i < lines.size(); i++) {
        if (i > 0) {
            result += '\n';
        }
        result += lines[i];
    }
    return result;
}

} // namespace fsays
