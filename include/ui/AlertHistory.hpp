#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

namespace sentinel::ui {

// Alerts-per-second history built from successive total_alerts readings.
// Lives on the dashboard side only; the ingestion path never touches it.
class AlertHistory {
public:
  using Clock = std::chrono::steady_clock;

  explicit AlertHistory(size_t capacity = 100) : capacity_(capacity ? capacity : 1) {}

  void observe(uint64_t total_alerts) { observe(total_alerts, Clock::now()); }

  // The first reading only sets the baseline. Every whole second elapsed
  // since the current bucket opened closes one bucket; readings that arrive
  // within a second accumulate into it. Silent seconds become zero buckets.
  void observe(uint64_t total_alerts, Clock::time_point now);

  [[nodiscard]] std::vector<uint64_t> values() const { return {buckets_.begin(), buckets_.end()}; }
  [[nodiscard]] size_t size() const { return buckets_.size(); }
  [[nodiscard]] size_t capacity() const { return capacity_; }
  [[nodiscard]] uint64_t peak() const;
  [[nodiscard]] uint64_t latest() const { return buckets_.empty() ? 0 : buckets_.back(); }

private:
  void push(uint64_t v);

  size_t capacity_;
  std::deque<uint64_t> buckets_;
  bool started_{false};
  uint64_t base_{0};
  uint64_t pending_{0};
  Clock::time_point bucket_start_{};
};

} // namespace sentinel::ui
