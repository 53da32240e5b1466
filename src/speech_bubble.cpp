#include "speech_bubble.hpp"
#include "text_wrap.hpp"
#include "unicode.hpp"
#include "verbose.hpp"

#include <algorithm>
#include <ios>

namespace fsays {

namespace {
    struct Borders {
        const char* left;
        const char* right;
    };

    // First match wins: a lone line is "< >", otherwise the rows form a
    // rounded bracket of "/ \", "| |" and "\ /".
    Borders borders_for(std::size_t index, std::size_t line_count) {
        if (line_count == 1) {
            return {"< ", " >"};
        }
        if (index == 0) {
            return {"/ ", " \\"};
        }
        if (index == line_count - 1) {
            return {"\\ ", " /"};
        }
        return {"| ", " |"};
    }
}

std::string render_bubble(const std::vector<std::string>& lines, Mascot mascot) {
    std::vector<std::size_t> widths;
    widths.reserve(lines.size());
    for (const auto& line : lines) {
        widths.push_back(unicode::display_width(line));
    }

    std::size_t actual_width = 0;
    if (!widths.empty()) {
        actual_width = *std::max_element(widths.begin(), widths.end());
    }

    const std::string& art = mascot_art(mascot);

    std::string result;
    result.reserve((actual_width + 8) * (lines.size() + 2) + art.size());

    // Top border
    result += ' ';
    result.append(actual_width + 2, '_');
    result += '\n';

    // Message rows
    for (std::size_t i = 0; i < lines.size(); i++) {
        Borders borders = borders_for(i, lines.size());
        result += borders.left;
        result += lines[i];
        result.append(actual_width - widths[i], ' ');
        result += borders.right;
        result += '\n';
    }

    // Bottom border
    result += ' ';
    result.append(actual_width + 2, '-');

    result += art;
    return result;
}

std::string format_bubble(const std::string& input, std::size_t max_width, Mascot mascot) {
    std::vector<std::string> lines = wrap_lines(normalize_whitespace(input), max_width);
    verbose_log("bubble", std::to_string(lines.size()) + " line(s) at max width " +
                std::to_string(max_width));
    return render_bubble(lines, mascot);
}

void say(const std::string& input, std::size_t max_width, std::ostream& out, Mascot mascot) {
    std::string bubble = format_bubble(input, max_width, mascot);

    out.write(bubble.data(), static_cast<std::streamsize>(bubble.size()));
    if (!out) {
        verbose_err("bubble", "stream rejected " + std::to_string(bubble.size()) + " bytes");
        throw std::ios_base::failure("failed to write speech bubble");
    }
}

void say(const std::string& input, std::size_t max_width, const OutputCallback& output,
         Mascot mascot) {
    output(format_bubble(input, max_width, mascot));
}

} // namespace fsays
