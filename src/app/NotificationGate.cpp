#include "app/NotificationGate.hpp"

namespace sentinel::app {

bool NotificationGate::should_notify(std::chrono::steady_clock::time_point now) {
  std::lock_guard<std::mutex> lk(mu_);
  if (last_sent_ && now - *last_sent_ <= cooldown_) return false;
  last_sent_ = now;
  return true;
}

} // namespace sentinel::app
