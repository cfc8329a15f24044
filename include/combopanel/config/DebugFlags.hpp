#pragma once

#include <string_view>

namespace CP::Config {

// Returns true when layout diagnostics (negative available space, dropped
// items) should be logged. Defaults to false; enable via
// COMBOPANEL_DEBUG_LAYOUT=1 (alias COMBOPANEL_DEBUG).
[[nodiscard]] auto LayoutDiagnosticsEnabled() -> bool;

// Environment flag parsing shared by the flags above and the test runner.
// A null value is false, an empty value is true, and 0/false/off/no (any case,
// surrounding whitespace ignored) are false.
[[nodiscard]] auto ParseTruthy(char const* value) -> bool;

} // namespace CP::Config
