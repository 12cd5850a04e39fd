#include "ui/Panels.hpp"
#include "ui/Formatting.hpp"
#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"
#include "util/Retro.hpp"
#include <algorithm>
#include <cstdio>

namespace sentinel::ui {

namespace {
// Columns between the two vertical borders
int inner_width(int width) { return std::max(3, width - 2); }
}

std::vector<std::string> render_status_panel(const sentinel::model::StatsSnapshot& s, int width) {
  using namespace std::chrono;
  const int iw = inner_width(width);
  auto elapsed_ms = duration_cast<milliseconds>(s.elapsed);
  std::vector<std::string> lines;
  lines.push_back(spread(iw, " Lines processed", std::to_string(s.total_lines) + " "));
  lines.push_back(spread(iw, " Alerts found", std::to_string(s.total_alerts) + " "));
  lines.push_back(spread(iw, " Notifications sent", std::to_string(s.notifications_sent) + " "));
  lines.push_back(spread(iw, " Elapsed", format_elapsed(duration_cast<seconds>(s.elapsed)) + " "));
  lines.push_back(spread(iw, " Rate", format_rate(s.total_lines, elapsed_ms) + " lines/s "));

  double pct = s.total_lines ? 100.0 * static_cast<double>(s.total_alerts) / static_cast<double>(s.total_lines) : 0.0;
  char pbuf[16];
  std::snprintf(pbuf, sizeof(pbuf), "%5.1f%%", pct);
  int bar_w = std::clamp(iw - 30, 4, 30);
  const bool uni = utf8_locale();
  std::string bar = uni ? sentinel::util::retro_bar(pct, bar_w)
                        : sentinel::util::retro_bar(pct, bar_w, "#", "-");
  lines.push_back(spread(iw, " Alert ratio", "[" + bar + "]" + pbuf + " "));

  std::string since = "never";
  if (s.since_last_notification)
    since = format_elapsed(duration_cast<seconds>(*s.since_last_notification)) + " ago";
  lines.push_back(spread(iw, " Last notification", since + " "));
  return make_box("Sentinel Status", lines, width);
}

std::vector<std::string> render_rate_panel(const AlertHistory& history, int width) {
  const int iw = inner_width(width);
  auto values = history.values();
  int spark_w = std::max(1, std::min<int>(iw - 2, static_cast<int>(history.capacity())));
  std::vector<std::string> lines;
  lines.push_back(" " + sentinel::util::retro_sparkline(values, spark_w, utf8_locale()));
  lines.push_back(spread(iw, " peak " + std::to_string(history.peak()) + "/s",
                           "now " + std::to_string(history.latest()) + "/s "));
  return make_box("Alert Rate (Last 100s)", lines, width);
}

std::vector<std::string> render_last_alert_panel(const sentinel::model::StatsSnapshot& s, int width, int height) {
  const int iw = inner_width(width);
  int body = std::max(1, height - 2);
  std::vector<std::string> lines;
  if (!s.last_alert) {
    lines.push_back(" No alerts yet.");
  } else {
    for (auto& l : wrap_lines(*s.last_alert, iw - 2, body)) lines.push_back(" " + l);
  }
  return make_box("Last Alert", lines, width, body);
}

} // namespace sentinel::ui
