#include "ui/AlertHistory.hpp"
#include <algorithm>

namespace sentinel::ui {

void AlertHistory::observe(uint64_t total_alerts, Clock::time_point now) {
  if (!started_) {
    started_ = true;
    base_ = total_alerts;
    bucket_start_ = now;
    return;
  }
  if (total_alerts > base_) pending_ += total_alerts - base_;
  base_ = total_alerts;

  auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - bucket_start_);
  if (elapsed.count() <= 0) return;
  push(pending_);
  pending_ = 0;
  // A long stall cannot contribute more zero buckets than the window holds
  auto zeros = std::min<long long>(elapsed.count() - 1, static_cast<long long>(capacity_));
  for (long long i = 0; i < zeros; ++i) push(0);
  bucket_start_ += elapsed;
}

uint64_t AlertHistory::peak() const {
  if (buckets_.empty()) return 0;
  return *std::max_element(buckets_.begin(), buckets_.end());
}

void AlertHistory::push(uint64_t v) {
  buckets_.push_back(v);
  while (buckets_.size() > capacity_) buckets_.pop_front();
}

} // namespace sentinel::ui
