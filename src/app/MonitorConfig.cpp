#include "app/MonitorConfig.hpp"
#include "app/ConfigError.hpp"
#include "util/Env.hpp"
#include "util/TomlReader.hpp"
#include <algorithm>
#include <cstdlib>
#include <string_view>

namespace sentinel::app {

namespace {

constexpr std::string_view kRulePrefix = "rule.";

int resolve_int(const util::TomlReader& toml, bool have_toml, const char* section,
                const char* key, const char* env_name, int def) {
  if (have_toml && toml.has(section, key)) return toml.get_int(section, key, def);
  return util::getenv_int(env_name, def);
}

std::optional<std::string> resolve_string(const util::TomlReader& toml, bool have_toml,
                                          const char* section, const char* key,
                                          const char* env_name) {
  if (have_toml && toml.has(section, key)) {
    auto v = toml.get_string(section, key);
    if (!v.empty()) return v;
    return std::nullopt;
  }
  return util::getenv_string(env_name);
}

std::vector<model::Rule> read_rules(const util::TomlReader& toml) {
  std::vector<model::Rule> rules;
  for (const auto& section : toml.section_names(kRulePrefix)) {
    model::Rule r;
    r.name = section.substr(kRulePrefix.size());
    if (r.name.empty()) throw ConfigError("rule section [" + section + "] has no name");
    if (!toml.has(section, "pattern")) throw ConfigError("rule '" + r.name + "': missing pattern");
    r.pattern = toml.get_string(section, "pattern");
    int thr = toml.get_int(section, "threshold", 1);
    if (thr < 0) throw ConfigError("rule '" + r.name + "': negative threshold");
    r.threshold = static_cast<uint64_t>(thr);
    rules.push_back(std::move(r));
  }
  return rules;
}

} // namespace

MonitorConfig default_config() {
  MonitorConfig c;
  c.rules = {
    {"Error", "(?i)error", 1},
    {"Panic", "(?i)panic", 1},
  };
  return c;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/sentinel/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/sentinel/config.toml";
  return {};
}

MonitorConfig load_config(const std::string& path) {
  MonitorConfig c = default_config();
  util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);

  if (have_toml) {
    auto rules = read_rules(toml);
    // A file that declares no rules keeps the defaults.
    if (!rules.empty()) c.rules = std::move(rules);
  }

  c.polling_interval_ms = std::clamp(
      resolve_int(toml, have_toml, "monitor", "polling_interval_ms", "SENTINEL_POLL_MS", c.polling_interval_ms),
      10, 1000);
  if (auto p = resolve_string(toml, have_toml, "monitor", "log_path", "SENTINEL_LOG_PATH")) c.log_path = *p;
  c.webhook_url = resolve_string(toml, have_toml, "monitor", "webhook_url", "SENTINEL_WEBHOOK_URL");
  return c;
}

} // namespace sentinel::app
