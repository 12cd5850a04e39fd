#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sentinel::model {

// Point-in-time copy of the aggregate counters for readers (the dashboard).
// total_alerts and total_lines are read independently and may be out of
// lockstep by a line or two while ingestion is running.
struct StatsSnapshot {
  uint64_t total_lines{};
  uint64_t total_alerts{};
  uint64_t notifications_sent{};
  std::optional<std::string> last_alert;
  std::optional<std::chrono::steady_clock::duration> since_last_notification;
  std::chrono::steady_clock::duration elapsed{};
};

} // namespace sentinel::model
