#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sentinel::ui {

// Terminal columns of s: one per UTF-8 code point, none for CSI sequences.
[[nodiscard]] int display_cols(std::string_view s);

// Longest prefix of s spanning at most cols columns. CSI sequences inside the
// prefix are kept.
[[nodiscard]] std::string take_cols(std::string_view s, int cols);

// Exactly w columns: space-padded, or cut with a trailing ellipsis.
[[nodiscard]] std::string fit_width(std::string_view s, int w);

// left, gap, right in exactly w columns. The right side is never cut.
[[nodiscard]] std::string spread(int w, std::string_view left, std::string_view right);

// Split on '\n', then hard-wrap each piece at w columns. At most max_lines
// are returned; when text is cut the last one ends with an ellipsis.
[[nodiscard]] std::vector<std::string> wrap_lines(std::string_view text, int w, int max_lines);

// "42s", "3m 07s", "2h 05m 09s"
[[nodiscard]] std::string format_elapsed(std::chrono::seconds secs);

// Lines per second with one decimal; "0.0" before the first full second.
[[nodiscard]] std::string format_rate(uint64_t lines, std::chrono::milliseconds elapsed);

} // namespace sentinel::ui
