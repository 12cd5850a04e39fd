#pragma once

#include "model/StatsSnapshot.hpp"
#include "ui/AlertHistory.hpp"
#include <string>
#include <vector>

namespace sentinel::ui {

// A titled frame of the given outer width around lines, padded with blank
// rows to at least min_height content rows. Rounded corners on UTF-8
// locales, '+' '-' '|' otherwise.
std::vector<std::string> make_box(const std::string& title, const std::vector<std::string>& lines,
                                  int width, int min_height = 0);

// Draws status, alert rate and last alert boxes top to bottom, with an
// optional help line above them, as one write to stdout.
void render_screen(const sentinel::model::StatsSnapshot& s, const AlertHistory& history,
                   bool show_help_line, const std::string& help_text);

} // namespace sentinel::ui
