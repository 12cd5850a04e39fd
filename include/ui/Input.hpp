#pragma once

namespace sentinel::ui {

enum class KeyAction { None, Quit, ToggleHelp };

// Waits up to timeout_ms (clamped to 10..1000) for stdin and reads what is
// pending. 'q' wins over 'h' within the same read.
[[nodiscard]] KeyAction poll_keys(int timeout_ms);

} // namespace sentinel::ui
