#pragma once
#include <chrono>
#include <mutex>
#include <optional>

namespace sentinel::app {

// Global cooldown across all alerts (not per rule). One instance is
// constructed by main and shared by reference with the pipeline.
class NotificationGate {
public:
  static constexpr std::chrono::seconds kDefaultCooldown{10};

  explicit NotificationGate(std::chrono::steady_clock::duration cooldown = kDefaultCooldown)
      : cooldown_(cooldown) {}
  NotificationGate(const NotificationGate&) = delete;
  NotificationGate& operator=(const NotificationGate&) = delete;

  // True for the first call ever, and afterwards only once the time since the
  // last allowed notification strictly exceeds the cooldown. Only an allowed
  // call moves the last-sent time.
  [[nodiscard]] bool should_notify() { return should_notify(std::chrono::steady_clock::now()); }
  [[nodiscard]] bool should_notify(std::chrono::steady_clock::time_point now);

  [[nodiscard]] std::chrono::steady_clock::duration cooldown() const { return cooldown_; }

private:
  const std::chrono::steady_clock::duration cooldown_;
  std::mutex mu_;
  std::optional<std::chrono::steady_clock::time_point> last_sent_;
};

} // namespace sentinel::app
