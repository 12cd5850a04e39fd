#pragma once

#include "model/StatsSnapshot.hpp"
#include "ui/AlertHistory.hpp"
#include <string>
#include <vector>

namespace sentinel::ui {

// Each returns a complete box (border included) of the given outer width.
std::vector<std::string> render_status_panel(const sentinel::model::StatsSnapshot& s, int width);
std::vector<std::string> render_rate_panel(const AlertHistory& history, int width);
std::vector<std::string> render_last_alert_panel(const sentinel::model::StatsSnapshot& s, int width, int height);

} // namespace sentinel::ui
