#include <catch2/catch.hpp>
#include "speech_bubble.hpp"
#include "text_wrap.hpp"
#include "unicode.hpp"
#include <algorithm>
#include <functional>
#include <ios>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace fsays;

namespace {

const std::string FERRIS_ART =
    "\n"
    "        \\\n"
    "         \\\n"
    "            _~^~^~_\n"
    "        \\) /  o o  \\ (/\n"
    "          '_   -   _'\n"
    "          / '-----' \\\n";

// Helper to collect output from the callback sink
class OutputCollector {
public:
    std::string result;
    int calls = 0;

    void operator()(const std::string& text) {
        result += text;
        calls++;
    }
};

// Splits the box part of a bubble (everything before the mascot) into rows.
std::vector<std::string> box_rows(const std::string& bubble, Mascot mascot) {
    const std::string& art = mascot_art(mascot);
    REQUIRE(bubble.size() >= art.size());
    REQUIRE(bubble.compare(bubble.size() - art.size(), art.size(), art) == 0);

    std::string box = bubble.substr(0, bubble.size() - art.size());
    std::vector<std::string> rows;
    std::istringstream stream(box);
    std::string row;
    while (std::getline(stream, row)) {
        rows.push_back(row);
    }
    return rows;
}

} // namespace

// ============================================================================
// Mascots
// ============================================================================

TEST_CASE("Ferris art matches the classic crab", "[mascot]") {
    REQUIRE(mascot_art(Mascot::Ferris) == FERRIS_ART);
}

TEST_CASE("Clippy art is framed by line feeds", "[mascot]") {
    const std::string& art = mascot_art(Mascot::Clippy);
    REQUIRE(art.rfind("\n        \\\n         \\\n            __\n", 0) == 0);
    REQUIRE(art.find("           @  @\n") != std::string::npos);
    REQUIRE(art.back() == '\n');
    REQUIRE(art.size() >= 6);
    REQUIRE(art.compare(art.size() - 6, 6, "\\___/\n") == 0);
}

TEST_CASE("Mascots are distinct", "[mascot]") {
    REQUIRE(mascot_art(Mascot::Ferris) != mascot_art(Mascot::Clippy));
}

// ============================================================================
// Exact layouts
// ============================================================================

TEST_CASE("Single line greeting renders the classic bubble", "[bubble]") {
    std::ostringstream out;
    say("Hello fellow Rustaceans!", 24, out, Mascot::Ferris);

    REQUIRE(out.str() ==
            " __________________________\n"
            "< Hello fellow Rustaceans! >\n"
            " --------------------------" + FERRIS_ART);
}

TEST_CASE("Two lines use slash brackets", "[bubble]") {
    std::string bubble = format_bubble("Hello fellow Rustaceans!", 12, Mascot::Ferris);

    REQUIRE(bubble ==
            " ______________\n"
            "/ Hello fellow \\\n"
            "\\ Rustaceans!  /\n"
            " --------------" + FERRIS_ART);
}

TEST_CASE("Middle lines use pipes", "[bubble]") {
    std::string bubble = format_bubble("aaa bbb ccc", 3, Mascot::Ferris);

    REQUIRE(box_rows(bubble, Mascot::Ferris) == std::vector<std::string>{
        " _____",
        "/ aaa \\",
        "| bbb |",
        "\\ ccc /",
        " -----",
    });
}

TEST_CASE("Empty message renders an empty single-line bubble", "[bubble][edge]") {
    std::string bubble = format_bubble("", 40, Mascot::Ferris);
    REQUIRE(bubble == " __\n<  >\n --" + FERRIS_ART);
}

TEST_CASE("Whitespace runs are merged before wrapping", "[bubble]") {
    std::string bubble = format_bubble("a    b", 80, Mascot::Ferris);
    REQUIRE(box_rows(bubble, Mascot::Ferris)[1] == "< a b >");
}

TEST_CASE("Blank paragraph lines are padded", "[bubble]") {
    std::string bubble = format_bubble("first\n\nsecond", 40, Mascot::Ferris);

    REQUIRE(box_rows(bubble, Mascot::Ferris) == std::vector<std::string>{
        " ________",
        "/ first  \\",
        "|        |",
        "\\ second /",
        " --------",
    });
}

TEST_CASE("Render draws the box around given lines", "[bubble]") {
    std::string bubble = render_bubble({"ab", "c"}, Mascot::Clippy);
    REQUIRE(bubble ==
            " ____\n"
            "/ ab \\\n"
            "\\ c  /\n"
            " ----" + mascot_art(Mascot::Clippy));
}

TEST_CASE("Render with no lines draws an empty box", "[bubble][edge]") {
    std::string bubble = render_bubble({}, Mascot::Ferris);
    REQUIRE(bubble == " __\n --" + FERRIS_ART);
}

// ============================================================================
// Display width
// ============================================================================

TEST_CASE("Wide characters pad by display width", "[bubble][unicode]") {
    // 日本語 is three code points, six columns
    const std::string nihongo = "\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E";
    std::string bubble = format_bubble(nihongo + " ab", 6, Mascot::Ferris);

    REQUIRE(box_rows(bubble, Mascot::Ferris) == std::vector<std::string>{
        " ________",
        "/ " + nihongo + " \\",
        "\\ ab     /",
        " --------",
    });
}

TEST_CASE("Combining marks do not widen the box", "[bubble][unicode]") {
    std::string bubble = format_bubble("ne\xCC\x81", 10, Mascot::Ferris);
    REQUIRE(box_rows(bubble, Mascot::Ferris) == std::vector<std::string>{
        " ____",
        "< ne\xCC\x81 >",
        " ----",
    });
}

// ============================================================================
// Invariants
// ============================================================================

TEST_CASE("Right borders align for every width", "[bubble][invariant]") {
    const std::vector<std::string> messages = {
        "The quick brown fox jumps over the lazy dog",
        "short",
        "\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E and ascii \xEF\xBC\xA1\xEF\xBC\xA2 mixed",
        "para one\n\npara two is a little longer",
        "x",
    };

    for (const auto& message : messages) {
        for (std::size_t width = 1; width <= 30; ++width) {
            std::string bubble = format_bubble(message, width, Mascot::Ferris);
            std::vector<std::string> rows = box_rows(bubble, Mascot::Ferris);
            std::size_t line_count = wrap_lines(normalize_whitespace(message), width).size();

            REQUIRE(rows.size() == line_count + 2);

            std::size_t top = unicode::display_width(rows.front());
            for (std::size_t i = 1; i + 1 < rows.size(); ++i) {
                // Body rows are one column wider than the top border (" " + width + 2)
                REQUIRE(unicode::display_width(rows[i]) == top + 1);
            }
        }
    }
}

TEST_CASE("Border lengths equal the widest line plus two", "[bubble][invariant]") {
    const std::vector<std::pair<std::string, std::size_t>> cases = {
        {"Hello fellow Rustaceans!", 24},
        {"Hello fellow Rustaceans!", 10},
        {"supercalifragilistic", 5},
        {"", 0},
        {"\xE6\x97\xA5\xE6\x9C\xAC", 1},
    };

    for (const auto& [message, width] : cases) {
        std::vector<std::string> lines = wrap_lines(normalize_whitespace(message), width);
        std::size_t actual_width = 0;
        for (const auto& line : lines) {
            actual_width = std::max(actual_width, unicode::display_width(line));
        }

        std::vector<std::string> rows = box_rows(format_bubble(message, width, Mascot::Ferris),
                                                 Mascot::Ferris);
        REQUIRE(rows.front() == " " + std::string(actual_width + 2, '_'));
        REQUIRE(rows.back() == " " + std::string(actual_width + 2, '-'));
    }
}

TEST_CASE("Single line bubbles use angle brackets, others never do", "[bubble][invariant]") {
    SECTION("one line") {
        std::vector<std::string> rows = box_rows(format_bubble("one line", 40, Mascot::Ferris),
                                                 Mascot::Ferris);
        REQUIRE(rows.size() == 3);
        REQUIRE(rows[1].front() == '<');
        REQUIRE(rows[1].back() == '>');
    }

    SECTION("several lines") {
        std::vector<std::string> rows = box_rows(
            format_bubble("several words that wrap onto lines", 8, Mascot::Ferris), Mascot::Ferris);
        REQUIRE(rows.size() > 4);
        for (std::size_t i = 1; i + 1 < rows.size(); ++i) {
            REQUIRE(rows[i].find('<') == std::string::npos);
            REQUIRE(rows[i].find('>') == std::string::npos);
        }
    }
}

TEST_CASE("Short ASCII word sets the box width", "[bubble]") {
    std::string first = format_bubble("Ferris", 40, Mascot::Ferris);
    std::string second = format_bubble("Ferris", 40, Mascot::Ferris);
    REQUIRE(first == second);
    REQUIRE(box_rows(first, Mascot::Ferris)[0] == " " + std::string(8, '_'));
}

// ============================================================================
// Edge cases
// ============================================================================

TEST_CASE("Over-long words widen the bubble", "[bubble][edge]") {
    // Not split: the box grows past the requested width
    std::string bubble = format_bubble("supercalifragilistic", 5, Mascot::Ferris);
    REQUIRE(box_rows(bubble, Mascot::Ferris)[1] == "< supercalifragilistic >");
}

TEST_CASE("Zero width gives one word per row", "[bubble][edge]") {
    std::string bubble = format_bubble("a bb", 0, Mascot::Ferris);
    REQUIRE(box_rows(bubble, Mascot::Ferris) == std::vector<std::string>{
        " ____",
        "/ a  \\",
        "\\ bb /",
        " ----",
    });
}

// ============================================================================
// Sinks
// ============================================================================

TEST_CASE("Stream and callback sinks receive identical bytes", "[sink]") {
    std::ostringstream out;
    say("same bytes either way", 10, out, Mascot::Ferris);

    OutputCollector collector;
    say("same bytes either way", 10, std::ref(collector), Mascot::Ferris);

    REQUIRE(out.str() == collector.result);
    REQUIRE(collector.calls == 1);
}

TEST_CASE("Default mascot is used when none is given", "[sink]") {
    std::ostringstream out;
    say("hi", 10, out);
    REQUIRE(out.str() == format_bubble("hi", 10, default_mascot()));
}

TEST_CASE("Stream write failure is reported", "[sink][error]") {
    std::ostream broken(nullptr);
    REQUIRE_THROWS_AS(say("hello", 10, broken, Mascot::Ferris), std::ios_base::failure);
}

TEST_CASE("Callback exceptions propagate unchanged", "[sink][error]") {
    OutputCallback failing = [](const std::string&) {
        throw std::runtime_error("sink closed");
    };
    REQUIRE_THROWS_WITH(say("hello", 10, failing, Mascot::Ferris), "sink closed");
}
