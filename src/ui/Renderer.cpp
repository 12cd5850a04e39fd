#include "ui/Renderer.hpp"
#include "ui/Config.hpp"
#include "ui/Formatting.hpp"
#include "ui/Panels.hpp"
#include "ui/Terminal.hpp"
#include <algorithm>

namespace sentinel::ui {

namespace {

struct BoxGlyphs {
  std::string_view top_left, top_right, bottom_left, bottom_right, horizontal, vertical;
};

const BoxGlyphs& box_glyphs() {
  static const BoxGlyphs rounded{"╭", "╮", "╰", "╯", "─", "│"};
  static const BoxGlyphs ascii{"+", "+", "+", "+", "-", "|"};
  return utf8_locale() ? rounded : ascii;
}

std::string run_of(std::string_view glyph, int n) {
  std::string out;
  for (int i = 0; i < n; ++i) out.append(glyph);
  return out;
}

// Borders grey with the "[ title ]" in the accent color; body rows in body_color.
void paint_box(const std::vector<std::string>& box, const std::string& body_color, std::vector<std::string>& out) {
  const auto& ui = ui_config();
  const auto grey = fg_color(8);
  const auto reset = sgr_reset();
  const auto bar = std::string(box_glyphs().vertical);
  for (size_t i = 0; i < box.size(); ++i) {
    const std::string& row = box[i];
    if (i == 0) {
      auto open = row.find("[ ");
      auto close = row.rfind(" ]");
      if (open == std::string::npos || close == std::string::npos) { out.push_back(grey + row + reset); continue; }
      out.push_back(grey + row.substr(0, open) + ui.accent + row.substr(open, close + 2 - open) +
                    grey + row.substr(close + 2) + reset);
    } else if (i + 1 == box.size() || row.size() < 2 * bar.size()) {
      out.push_back(grey + row + reset);
    } else {
      auto inner = row.substr(bar.size(), row.size() - 2 * bar.size());
      auto body = body_color.empty() ? inner : body_color + inner + reset;
      out.push_back(grey + bar + reset + body + grey + bar + reset);
    }
  }
}

} // namespace

std::vector<std::string> make_box(const std::string& title, const std::vector<std::string>& lines,
                                  int width, int min_height) {
  const auto& g = box_glyphs();
  const int inner = std::max(3, width - 2);
  const std::string label = "[ " + title + " ]";
  const int spare = std::max(0, inner - display_cols(label));

  std::vector<std::string> box;
  box.reserve(std::max<size_t>(lines.size(), static_cast<size_t>(std::max(min_height, 0))) + 2);
  box.push_back(std::string(g.top_left) + run_of(g.horizontal, spare / 2) + label +
                run_of(g.horizontal, spare - spare / 2) + std::string(g.top_right));
  const size_t rows = std::max(lines.size(), static_cast<size_t>(std::max(min_height, 0)));
  for (size_t i = 0; i < rows; ++i) {
    std::string_view text = i < lines.size() ? std::string_view(lines[i]) : std::string_view{};
    box.push_back(std::string(g.vertical) + fit_width(text, inner) + std::string(g.vertical));
  }
  box.push_back(std::string(g.bottom_left) + run_of(g.horizontal, inner) + std::string(g.bottom_right));
  return box;
}

void render_screen(const sentinel::model::StatsSnapshot& s, const AlertHistory& history,
                   bool show_help_line, const std::string& help_text) {
  const auto size = terminal_size();
  const int cols = std::max(20, size.cols);
  const int rows = std::max(1, size.rows);
  const int body_rows = std::max(0, rows - (show_help_line ? 1 : 0));
  const auto& ui = ui_config();

  auto status = render_status_panel(s, cols);
  auto rate = render_rate_panel(history, cols);
  const int alert_rows = std::max(3, body_rows - static_cast<int>(status.size() + rate.size()));
  auto last = render_last_alert_panel(s, cols, alert_rows);

  std::vector<std::string> painted;
  painted.reserve(status.size() + rate.size() + last.size());
  paint_box(status, {}, painted);
  paint_box(rate, ui.warning, painted);
  paint_box(last, s.last_alert ? ui.warning : ui.muted, painted);

  std::string frame = "\x1B[H";
  frame.reserve(static_cast<size_t>(rows) * static_cast<size_t>(cols) * 2);
  if (show_help_line) frame += sgr("1") + fit_width(help_text, cols) + sgr_reset() + "\n";
  const std::string blank(static_cast<size_t>(cols), ' ');
  for (int r = 0; r < body_rows; ++r) {
    frame += r < static_cast<int>(painted.size()) ? painted[static_cast<size_t>(r)] : blank;
    if (r + 1 < body_rows) frame += '\n';
  }
  write_stdout(frame);
}

} // namespace sentinel::ui
