#include "mascot.hpp"

namespace fsays {

namespace {
    const std::string FERRIS = R"ART(
        \
         \
            _~^~^~_
        \) /  o o  \ (/
          '_   -   _'
          / '-----' \
)ART";

    const std::string CLIPPY = R"ART(
        \
         \
            __
           /  \
           |  |
           @  @
           |  |
           || |/
           || ||
           |\_/|
           \___/
)ART";
}

const std::string& mascot_art(Mascot mascot) {
    switch (mascot) {
        case Mascot::Clippy:
            return CLIPPY;
        case Mascot::Ferris:
            break;
    }
    return FERRIS;
}

} // namespace fsays
