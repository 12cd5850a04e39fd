#pragma once

#include <string>

namespace sentinel::ui {

// Resolved SGR sequences for the dashboard color roles
struct UIConfig {
  std::string accent;
  std::string warning;
  std::string muted;
  bool alt_screen{true};
};

// Resolved once from env (SENTINEL_ACCENT_IDX, SENTINEL_WARNING_IDX,
// SENTINEL_MUTED_IDX, SENTINEL_ALT_SCREEN) with compiled defaults.
const UIConfig& ui_config();

} // namespace sentinel::ui
