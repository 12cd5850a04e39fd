#pragma once
#include <optional>
#include <string>

namespace sentinel::util {

// Look up NAME, also accepting the lower-case "sentinel_" spelling of a
// "SENTINEL_" variable (and vice versa). Empty values count as unset.
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
std::optional<std::string> getenv_string(const char* name);

} // namespace sentinel::util
