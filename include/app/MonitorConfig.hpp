#pragma once
#include "model/Rule.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sentinel::app {

struct MonitorConfig {
  std::vector<model::Rule> rules;
  int polling_interval_ms{100};            // dashboard tick
  std::optional<std::string> webhook_url;  // no notifications when unset
  std::string log_path{"test.log"};
};

// Error + Panic rules, 100ms tick, no webhook.
[[nodiscard]] MonitorConfig default_config();

// $XDG_CONFIG_HOME/sentinel/config.toml or ~/.config/sentinel/config.toml;
// empty if neither variable is set.
[[nodiscard]] std::string config_file_path();

// Resolve every setting TOML -> env -> compiled default. A missing file is
// not an error (defaults apply). Throws ConfigError for a malformed rule
// section. Patterns are not compiled here; PatternMatcher does that.
[[nodiscard]] MonitorConfig load_config(const std::string& path);

} // namespace sentinel::app
