#pragma once
#include <cstdint>
#include <string>

namespace sentinel::model {

struct Rule {
  std::string name;
  std::string pattern;   // regular expression, optional leading (?i)
  uint64_t threshold{1}; // carried from config, not enforced
};

} // namespace sentinel::model
