#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace sentinel::util {

// Build a retro-styled progress bar: [████░░░░] pct%.
// pct in 0..100, width is the number of cells inside the brackets.
// Uses UTF-8 block characters for fill/track by default.
auto retro_bar(double pct, int width = 20, const std::string& fill = "█", const std::string& track = "░") -> std::string;

// One cell per value, scaled against the largest value; the newest values
// are kept when there are more than width and the line is left-padded with
// spaces when there are fewer. Zero renders as the lowest level.
auto retro_sparkline(const std::vector<uint64_t>& values, int width, bool unicode = true) -> std::string;

} // namespace sentinel::util
