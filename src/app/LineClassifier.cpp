#include "app/LineClassifier.hpp"
#include "util/AsciiLower.hpp"
#include <cctype>
#include <nlohmann/json.hpp>

namespace sentinel::app {

namespace {

bool looks_structured(std::string_view line) {
  for (char c : line) {
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    return c == '{';
  }
  return false;
}

// false => field has a value of the wrong type
bool read_string_field(const nlohmann::json& obj, const char* key, std::optional<std::string>& out) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return true;
  if (!it->is_string()) return false;
  out = it->get<std::string>();
  return true;
}

bool is_severe_level(const std::string& level) {
  auto l = util::ascii_lower(level);
  return l == "error" || l == "panic" || l == "fatal";
}

bool is_alert_rule_name(const std::string& name) {
  auto n = util::ascii_lower(name);
  return n.find("error") != std::string::npos || n.find("panic") != std::string::npos;
}

} // namespace

std::optional<StructuredFields> parse_structured(std::string_view line) {
  auto doc = nlohmann::json::parse(line.begin(), line.end(), nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded() || !doc.is_object()) return std::nullopt;
  StructuredFields f;
  if (!read_string_field(doc, "level", f.level)) return std::nullopt;
  if (!read_string_field(doc, "severity", f.severity)) return std::nullopt;
  if (!read_string_field(doc, "msg", f.msg)) return std::nullopt;
  if (!read_string_field(doc, "message", f.message)) return std::nullopt;
  return f;
}

std::optional<model::Classification> LineClassifier::classify_structured(std::string_view line) const {
  if (!looks_structured(line)) return std::nullopt;
  auto fields = parse_structured(line);
  if (!fields) return std::nullopt;

  const auto& level = fields->level ? fields->level : fields->severity;
  if (!level || !is_severe_level(*level)) return std::nullopt;

  std::string text = fields->message ? *fields->message
                   : fields->msg     ? *fields->msg
                                     : std::string(line);
  model::Classification c;
  c.is_alert = true;
  c.message = "structured: " + text;
  c.origin = model::AlertOrigin::Structured;
  return c;
}

std::optional<model::Classification> LineClassifier::classify_pattern(std::string_view line) const {
  auto idx = matcher_.match(line);
  if (!idx) return std::nullopt;
  // A hit on e.g. an "Info" rule is a match but not an alert.
  if (!is_alert_rule_name(matcher_.rule(*idx).name)) return std::nullopt;
  model::Classification c;
  c.is_alert = true;
  c.message = std::string(line);
  c.origin = model::AlertOrigin::Pattern;
  c.rule_index = idx;
  return c;
}

model::Classification LineClassifier::classify(std::string_view line) const {
  if (auto c = classify_structured(line)) return std::move(*c);
  if (auto c = classify_pattern(line)) return std::move(*c);
  return {};
}

} // namespace sentinel::app
