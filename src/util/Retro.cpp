#include "util/Retro.hpp"
#include <algorithm>
#include <cmath>

namespace sentinel::util {

auto retro_bar(double pct, int width, const std::string& fill, const std::string& track) -> std::string {
  pct = std::clamp(pct, 0.0, 100.0);
  int filled = static_cast<int>(std::round((pct / 100.0) * width));
  if (filled > width) filled = width;
  std::string s;
  s.reserve(width + 10);
  s.push_back(' ');
  for (int i = 0; i < width; ++i) {
    if (i < filled) s += fill; else s += track;
  }
  s.push_back(' ');
  return s;
}

auto retro_sparkline(const std::vector<uint64_t>& values, int width, bool unicode) -> std::string {
  static const char* const kUni[] = {"▁", "▂", "▃", "▄", "▅", "▆", "▇", "█"};
  static const char* const kAscii[] = {"_", ".", ":", "-", "=", "+", "*", "#"};
  constexpr int kLevels = 8;
  if (width <= 0) return {};
  const auto* levels = unicode ? kUni : kAscii;
  size_t n = std::min(values.size(), static_cast<size_t>(width));
  size_t first = values.size() - n;
  uint64_t peak = 0;
  for (size_t i = first; i < values.size(); ++i) peak = std::max(peak, values[i]);

  std::string s(static_cast<size_t>(width) - n, ' ');
  for (size_t i = first; i < values.size(); ++i) {
    int lvl = 0;
    if (peak > 0 && values[i] > 0) {
      lvl = static_cast<int>(std::ceil(static_cast<double>(values[i]) * (kLevels - 1) / static_cast<double>(peak)));
      lvl = std::clamp(lvl, 1, kLevels - 1);
    }
    s += levels[lvl];
  }
  return s;
}

} // namespace sentinel::util
