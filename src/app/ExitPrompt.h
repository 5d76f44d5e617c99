#pragma once

#include "core/Status.h"

#include <iosfwd>

namespace gw2util::app {

// Logs a failed status and, when `pause` is set, blocks on
// "press the [ENTER] key to exit..." so a double-clicked console window does
// not vanish before the user can read it.
//
// Returns the process exit code: 0 for success, 1 for any failure.
[[nodiscard]] int ExitWithPrompt(const core::Status& status, bool pause,
                                 std::istream& in, std::ostream& out);

} // namespace gw2util::app
