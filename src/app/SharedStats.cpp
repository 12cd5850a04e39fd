#include "app/SharedStats.hpp"
#include <utility>

namespace sentinel::app {

void SharedStats::record_alert(std::string message) {
  total_alerts_.fetch_add(1, std::memory_order_relaxed);
  std::lock_guard<std::mutex> lk(alert_mu_);
  last_alert_ = std::move(message);
}

void SharedStats::record_notification(std::chrono::steady_clock::time_point when) {
  notifications_.fetch_add(1, std::memory_order_relaxed);
  std::lock_guard<std::mutex> lk(notify_mu_);
  last_notification_ = when;
}

std::optional<std::string> SharedStats::last_alert() const {
  std::lock_guard<std::mutex> lk(alert_mu_);
  return last_alert_;
}

model::StatsSnapshot SharedStats::snapshot() const {
  auto now = std::chrono::steady_clock::now();
  model::StatsSnapshot s{};
  s.total_lines = total_lines();
  s.total_alerts = total_alerts();
  s.notifications_sent = notifications_sent();
  s.last_alert = last_alert();
  {
    std::lock_guard<std::mutex> lk(notify_mu_);
    if (last_notification_) s.since_last_notification = now - *last_notification_;
  }
  s.elapsed = now - start_;
  return s;
}

} // namespace sentinel::app
