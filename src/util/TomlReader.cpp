#include "util/TomlReader.hpp"
#include <cctype>
#include <charconv>
#include <fstream>

namespace sentinel::util {

namespace {

std::string_view strip(std::string_view sv) {
  size_t b = 0, e = sv.size();
  while (b < e && std::isspace(static_cast<unsigned char>(sv[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(sv[e - 1]))) --e;
  return sv.substr(b, e - b);
}

// Body of a "basic" string starting after the opening quote; stops at the
// first unescaped quote.
std::string decode_basic(std::string_view body) {
  std::string out;
  out.reserve(body.size());
  for (size_t i = 0; i < body.size(); ++i) {
    char c = body[i];
    if (c == '"') break;
    if (c != '\\' || i + 1 == body.size()) { out.push_back(c); continue; }
    switch (char e = body[++i]) {
      case 'n':  out.push_back('\n'); break;
      case 't':  out.push_back('\t'); break;
      case '"':  out.push_back('"'); break;
      case '\\': out.push_back('\\'); break;
      default:   out.push_back('\\'); out.push_back(e); break;
    }
  }
  return out;
}

std::string decode_value(std::string_view raw) {
  if (raw.empty()) return {};
  if (raw.front() == '\'') {
    auto close = raw.find('\'', 1);
    return std::string(raw.substr(1, close == std::string_view::npos ? raw.size() - 1 : close - 1));
  }
  if (raw.front() == '"') return decode_basic(raw.substr(1));
  // Bare value: a trailing comment needs whitespace before '#'
  for (size_t i = 1; i < raw.size(); ++i) {
    if (raw[i] == '#' && std::isspace(static_cast<unsigned char>(raw[i - 1])))
      return std::string(strip(raw.substr(0, i)));
  }
  return std::string(raw);
}

} // namespace

bool TomlReader::load(const std::string& path) {
  tables_.clear();
  std::ifstream in(path);
  if (!in.is_open()) return false;
  Table* current = &open_table("");
  std::string line;
  while (std::getline(in, line)) {
    auto sv = strip(line);
    if (sv.empty() || sv.front() == '#') continue;
    if (sv.front() == '[') {
      auto close = sv.find(']');
      if (close == std::string_view::npos) continue;
      current = &open_table(strip(sv.substr(1, close - 1)));
      continue;
    }
    auto eq = sv.find('=');
    if (eq == std::string_view::npos || eq == 0) continue;
    current->values.insert_or_assign(std::string(strip(sv.substr(0, eq))),
                                     decode_value(strip(sv.substr(eq + 1))));
  }
  // The implicit root table only counts when it holds something
  if (tables_.front().values.empty()) tables_.erase(tables_.begin());
  return true;
}

std::optional<std::string> TomlReader::value(std::string_view table, std::string_view key) const {
  const Table* t = find(table);
  if (!t) return std::nullopt;
  auto it = t->values.find(key);
  if (it == t->values.end()) return std::nullopt;
  return it->second;
}

int TomlReader::get_int(std::string_view table, std::string_view key, int def) const {
  auto v = value(table, key);
  if (!v || v->empty()) return def;
  const char* first = v->data();
  const char* last = first + v->size();
  if (*first == '+') ++first;
  int out = 0;
  auto [ptr, ec] = std::from_chars(first, last, out);
  if (ec != std::errc{} || ptr != last) return def;
  return out;
}

std::vector<std::string> TomlReader::section_names(std::string_view prefix) const {
  std::vector<std::string> names;
  for (const auto& t : tables_)
    if (t.name.starts_with(prefix)) names.push_back(t.name);
  return names;
}

const TomlReader::Table* TomlReader::find(std::string_view name) const {
  for (const auto& t : tables_)
    if (t.name == name) return &t;
  return nullptr;
}

TomlReader::Table& TomlReader::open_table(std::string_view name) {
  for (auto& t : tables_)
    if (t.name == name) return t;
  tables_.push_back(Table{std::string(name), {}});
  return tables_.back();
}

} // namespace sentinel::util
