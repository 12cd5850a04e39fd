#include "util/Env.hpp"
#include <charconv>
#include <cstdlib>
#include <cstring>

namespace sentinel::util {

namespace {

constexpr size_t kPrefixLen = sizeof("SENTINEL_") - 1;

const char* nonempty_env(const char* name) {
  const char* v = std::getenv(name);
  return (v && *v) ? v : nullptr;
}

} // namespace

const char* getenv_compat(const char* name) {
  if (const char* v = nonempty_env(name)) return v;
  // Same variable under the other spelling of the prefix
  std::string other(name);
  if (other.starts_with("SENTINEL_")) std::memcpy(other.data(), "sentinel_", kPrefixLen);
  else if (other.starts_with("sentinel_")) std::memcpy(other.data(), "SENTINEL_", kPrefixLen);
  else return nullptr;
  return nonempty_env(other.c_str());
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  const char* end = v + std::strlen(v);
  int out = 0;
  auto [ptr, ec] = std::from_chars(v, end, out);
  return (ec == std::errc{} && ptr == end) ? out : defv;
}

std::optional<std::string> getenv_string(const char* name) {
  if (const char* v = getenv_compat(name)) return std::string(v);
  return std::nullopt;
}

} // namespace sentinel::util
