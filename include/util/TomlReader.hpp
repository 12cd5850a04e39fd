#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sentinel::util {

// Reader for the TOML subset sentinel's config uses:
//   [table] headers, dotted names kept verbatim ("rule.Error")
//   key = value, with bare, "basic" (\\ \" \n \t escapes) or 'literal' values
//   '#' comments, whole-line or trailing a value
// Keys before the first header live in the "" table. Tables keep file order;
// a repeated key overwrites the earlier value.
class TomlReader {
public:
  // False when the file cannot be opened. Lines that are neither a header
  // nor key = value are skipped.
  bool load(const std::string& path);

  [[nodiscard]] std::optional<std::string> value(std::string_view table, std::string_view key) const;

  [[nodiscard]] std::string get_string(std::string_view table, std::string_view key,
                                       const std::string& def = "") const {
    return value(table, key).value_or(def);
  }

  // def when absent or not an integer in full.
  [[nodiscard]] int get_int(std::string_view table, std::string_view key, int def = 0) const;

  [[nodiscard]] bool has(std::string_view table, std::string_view key) const {
    return value(table, key).has_value();
  }
  [[nodiscard]] bool has_section(std::string_view table) const { return find(table) != nullptr; }

  // Table names in file order, optionally filtered by prefix.
  [[nodiscard]] std::vector<std::string> section_names(std::string_view prefix = {}) const;

private:
  struct Table {
    std::string name;
    std::map<std::string, std::string, std::less<>> values;
  };

  std::vector<Table> tables_;

  [[nodiscard]] const Table* find(std::string_view name) const;
  Table& open_table(std::string_view name);
};

} // namespace sentinel::util
