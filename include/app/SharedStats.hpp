#pragma once
#include "model/StatsSnapshot.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace sentinel::app {

// Aggregate state written by the ingestion pipeline and read concurrently by
// the dashboard and the self-test summary.
//
// Counters are independent relaxed atomics. last_alert and the last
// notification time each sit behind their own short mutex. The two counters
// are not updated as one unit, so a reader may see total_alerts move a line
// ahead of or behind total_lines.
class SharedStats {
public:
  SharedStats() : start_(std::chrono::steady_clock::now()) {}
  SharedStats(const SharedStats&) = delete;
  SharedStats& operator=(const SharedStats&) = delete;

  void record_line() { total_lines_.fetch_add(1, std::memory_order_relaxed); }
  void record_alert(std::string message);
  void record_notification(std::chrono::steady_clock::time_point when);

  [[nodiscard]] uint64_t total_lines() const { return total_lines_.load(std::memory_order_relaxed); }
  [[nodiscard]] uint64_t total_alerts() const { return total_alerts_.load(std::memory_order_relaxed); }
  [[nodiscard]] uint64_t notifications_sent() const { return notifications_.load(std::memory_order_relaxed); }
  [[nodiscard]] std::optional<std::string> last_alert() const;
  [[nodiscard]] std::chrono::steady_clock::time_point start_time() const { return start_; }

  [[nodiscard]] model::StatsSnapshot snapshot() const;

private:
  const std::chrono::steady_clock::time_point start_;
  std::atomic<uint64_t> total_lines_{0};
  std::atomic<uint64_t> total_alerts_{0};
  std::atomic<uint64_t> notifications_{0};

  mutable std::mutex alert_mu_;
  std::optional<std::string> last_alert_;

  mutable std::mutex notify_mu_;
  std::optional<std::chrono::steady_clock::time_point> last_notification_;
};

} // namespace sentinel::app
