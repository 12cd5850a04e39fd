#pragma once
#include "app/PatternMatcher.hpp"
#include "model/Classification.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace sentinel::app {

// Fields of a JSON log record that matter for severity. Anything else in the
// record is ignored.
struct StructuredFields {
  std::optional<std::string> level;
  std::optional<std::string> severity;
  std::optional<std::string> msg;
  std::optional<std::string> message;
};

// Parse a line that looks like a JSON object. Returns nullopt when the line
// is not valid JSON, not an object, or one of the four fields above holds a
// non-string value (null counts as absent).
[[nodiscard]] std::optional<StructuredFields> parse_structured(std::string_view line);

class LineClassifier {
public:
  explicit LineClassifier(const PatternMatcher& matcher) : matcher_(matcher) {}

  // Structured path first, pattern rules as fallback. A structured line
  // whose level is not error/panic/fatal is still checked against the rules.
  [[nodiscard]] model::Classification classify(std::string_view line) const;

  [[nodiscard]] const PatternMatcher& matcher() const { return matcher_; }

private:
  [[nodiscard]] std::optional<model::Classification> classify_structured(std::string_view line) const;
  [[nodiscard]] std::optional<model::Classification> classify_pattern(std::string_view line) const;

  const PatternMatcher& matcher_;
};

} // namespace sentinel::app
