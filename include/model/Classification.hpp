#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace sentinel::model {

enum class AlertOrigin { None, Structured, Pattern };

struct Classification {
  bool is_alert{false};
  std::string message;                  // empty for non-alerts
  AlertOrigin origin{AlertOrigin::None};
  std::optional<size_t> rule_index;     // Pattern only
};

} // namespace sentinel::model
