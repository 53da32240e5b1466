#pragma once

/**
 * ASCII-art mascots drawn under the speech bubble.
 *
 * Which mascot a build uses by default is decided at configure time with the
 * FSAYS_CLIPPY CMake option; it is never chosen from runtime input.
 */

#include <string>

namespace fsays {

enum class Mascot {
    Ferris,  // The crab.
    Clippy   // The paperclip.
};

// Returns the art for a mascot. Starts and ends with a line feed.
const std::string& mascot_art(Mascot mascot);

// Returns the mascot selected for this build.
inline Mascot default_mascot() {
#ifdef FSAYS_CLIPPY
    return Mascot::Clippy;
#else
    return Mascot::Ferris;
#endif
}

} // namespace fsays
