#pragma once
#include <stdexcept>

namespace sentinel::app {

// Startup configuration problems (bad rule pattern, malformed rule section).
// Fatal: the pipeline must not start with an unusable rule set.
struct ConfigError : public std::runtime_error { using std::runtime_error::runtime_error; };

} // namespace sentinel::app
