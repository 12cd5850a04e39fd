#pragma once
#include "model/Rule.hpp"
#include <re2/re2.h>
#include <re2/set.h>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace sentinel::app {

// Ordered rule set compiled once at startup into a single RE2::Set, so a
// line is scanned once for all rules in time linear in its length.
// match() reports the lowest-index rule whose pattern occurs anywhere in
// the line: the first declared rule wins when several match.
//
// Patterns use RE2 syntax, including inline flag groups such as "(?i)".
// Backreferences and lookaround are rejected at construction.
class PatternMatcher {
public:
  // Throws ConfigError naming the rule if any pattern fails to compile.
  explicit PatternMatcher(const std::vector<model::Rule>& rules);
  ~PatternMatcher();
  PatternMatcher(PatternMatcher&&) noexcept;
  PatternMatcher& operator=(PatternMatcher&&) noexcept;

  [[nodiscard]] std::optional<size_t> match(std::string_view line) const;

  [[nodiscard]] size_t size() const { return rules_.size(); }
  [[nodiscard]] const model::Rule& rule(size_t idx) const { return rules_.at(idx); }

private:
  std::vector<model::Rule> rules_;
  // Per-rule programs; used for validation and when the set's DFA runs out of memory.
  std::vector<std::unique_ptr<re2::RE2>> compiled_;
  std::unique_ptr<re2::RE2::Set> set_;
};

} // namespace sentinel::app
