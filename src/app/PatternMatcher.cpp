#include "app/PatternMatcher.hpp"
#include "app/ConfigError.hpp"
#include <algorithm>
#include <string>

namespace sentinel::app {

namespace {

re2::RE2::Options rule_options() {
  re2::RE2::Options opt;
  // Errors surface through ConfigError; RE2 must not write to stderr
  opt.set_log_errors(false);
  return opt;
}

[[noreturn]] void reject(const model::Rule& r, const std::string& why) {
  throw ConfigError("rule '" + r.name + "': invalid pattern '" + r.pattern + "': " + why);
}

} // namespace

PatternMatcher::PatternMatcher(const std::vector<model::Rule>& rules) : rules_(rules) {
  const auto opt = rule_options();
  compiled_.reserve(rules_.size());
  for (const auto& r : rules_) {
    auto re = std::make_unique<re2::RE2>(r.pattern, opt);
    if (!re->ok()) reject(r, re->error());
    compiled_.push_back(std::move(re));
  }
  if (rules_.empty()) return;

  set_ = std::make_unique<re2::RE2::Set>(opt, re2::RE2::UNANCHORED);
  for (const auto& r : rules_) {
    std::string err;
    if (set_->Add(r.pattern, &err) < 0) reject(r, err);
  }
  if (!set_->Compile()) throw ConfigError("rule set too large to compile");
}

PatternMatcher::~PatternMatcher() = default;
PatternMatcher::PatternMatcher(PatternMatcher&&) noexcept = default;
PatternMatcher& PatternMatcher::operator=(PatternMatcher&&) noexcept = default;

std::optional<size_t> PatternMatcher::match(std::string_view line) const {
  if (!set_) return std::nullopt;
  re2::StringPiece text(line.data(), line.size());
  std::vector<int> hits;
  re2::RE2::Set::ErrorInfo info{};
  if (set_->Match(text, &hits, &info)) {
    // Set indices follow Add() order, which is declaration order
    return static_cast<size_t>(*std::min_element(hits.begin(), hits.end()));
  }
  if (info.kind == re2::RE2::Set::kNoError) return std::nullopt;

  // DFA budget exhausted on this line: fall back to one pass per rule, in order
  for (size_t i = 0; i < compiled_.size(); ++i) {
    if (re2::RE2::PartialMatch(text, *compiled_[i])) return i;
  }
  return std::nullopt;
}

} // namespace sentinel::app
