#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include <algorithm>
#include <cstdio>

namespace sentinel::ui {

namespace {

// One printable cell or one escape sequence starting at s[i].
struct Unit { size_t len; int cols; };

Unit unit_at(std::string_view s, size_t i) {
  const auto c = static_cast<unsigned char>(s[i]);
  if (c == 0x1B && i + 1 < s.size() && s[i + 1] == '[') {
    // CSI: parameters then one final byte in '@'..'~'
    size_t j = i + 2;
    while (j < s.size() && (s[j] < '@' || s[j] > '~')) ++j;
    return {std::min(j + 1, s.size()) - i, 0};
  }
  size_t len = c < 0x80 ? 1 : (c & 0xE0) == 0xC0 ? 2 : (c & 0xF0) == 0xE0 ? 3 : (c & 0xF8) == 0xF0 ? 4 : 1;
  return {std::min(len, s.size() - i), 1};
}

const char* ellipsis() { return utf8_locale() ? "…" : "."; }

} // namespace

int display_cols(std::string_view s) {
  int cols = 0;
  for (size_t i = 0; i < s.size();) {
    auto u = unit_at(s, i);
    cols += u.cols;
    i += u.len;
  }
  return cols;
}

std::string take_cols(std::string_view s, int cols) {
  size_t end = 0;
  int used = 0;
  while (end < s.size()) {
    auto u = unit_at(s, end);
    if (used + u.cols > cols) break;
    used += u.cols;
    end += u.len;
  }
  return std::string(s.substr(0, end));
}

std::string fit_width(std::string_view s, int w) {
  if (w <= 0) return {};
  int have = display_cols(s);
  if (have <= w) return std::string(s) + std::string(static_cast<size_t>(w - have), ' ');
  if (w == 1) return take_cols(s, 1);
  return take_cols(s, w - 1) + ellipsis();
}

std::string spread(int w, std::string_view left, std::string_view right) {
  if (w <= 0) return {};
  int rcols = display_cols(right);
  std::string l = fit_width(left, std::max(0, w - rcols - 1));
  int gap = std::max(0, w - display_cols(l) - rcols);
  return l + std::string(static_cast<size_t>(gap), ' ') + std::string(right);
}

std::vector<std::string> wrap_lines(std::string_view text, int w, int max_lines) {
  std::vector<std::string> out;
  if (w <= 0 || max_lines <= 0) return out;
  const auto cap = static_cast<size_t>(max_lines);
  bool cut = false;
  for (size_t pos = 0;;) {
    size_t nl = text.find('\n', pos);
    std::string_view piece = text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
    // An empty piece still occupies one row
    do {
      if (out.size() == cap) { cut = true; break; }
      out.push_back(take_cols(piece, w));
      piece.remove_prefix(out.back().size());
    } while (!piece.empty());
    if (cut || nl == std::string_view::npos) break;
    pos = nl + 1;
  }
  if (cut) {
    auto& last = out.back();
    if (display_cols(last) >= w) last = take_cols(last, w - 1);
    last += ellipsis();
  }
  return out;
}

std::string format_elapsed(std::chrono::seconds secs) {
  const long long t = std::max<long long>(0, secs.count());
  const long long h = t / 3600, m = t / 60 % 60, s = t % 60;
  char buf[48];
  if (h) std::snprintf(buf, sizeof(buf), "%lldh %02lldm %02llds", h, m, s);
  else if (m) std::snprintf(buf, sizeof(buf), "%lldm %02llds", m, s);
  else std::snprintf(buf, sizeof(buf), "%llds", s);
  return buf;
}

std::string format_rate(uint64_t lines, std::chrono::milliseconds elapsed) {
  if (elapsed.count() < 1000) return "0.0";
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f",
                static_cast<double>(lines) * 1000.0 / static_cast<double>(elapsed.count()));
  return buf;
}

} // namespace sentinel::ui
