#include "minitest.hpp"
#include "util/TomlReader.hpp"
#include <filesystem>
#include <fstream>
#include <string>

using sentinel::util::TomlReader;

namespace {

// Config text written to /tmp for the lifetime of one test.
struct ConfigFile {
  std::string path;
  ConfigFile(const char* tag, const std::string& text)
      : path(std::string("/tmp/sentinel_toml_") + tag + ".toml") {
    std::ofstream(path) << text;
  }
  ~ConfigFile() { std::error_code ec; std::filesystem::remove(path, ec); }
};

const char* kSampleConfig =
  "# sentinel sample\n"
  "[monitor]\n"
  "log_path = \"/var/log/app.log\"   # tailed file\n"
  "polling_interval_ms = 250\n"
  "webhook_url = \"https://hooks.example.com/T0/B0\"\n"
  "\n"
  "[rule.Panic]\n"
  "pattern = '(?i)panic'\n"
  "\n"
  "[rule.Timeout]\n"
  "pattern = \"timed?\\\\s+out\"\n"
  "threshold = 5\n";

} // namespace

TEST(toml_missing_file_reports_false) {
  TomlReader tr;
  ASSERT_TRUE(!tr.load("/tmp/sentinel_toml_does_not_exist.toml"));
  ASSERT_TRUE(tr.section_names().empty());
}

TEST(toml_monitor_table) {
  ConfigFile f("monitor", kSampleConfig);
  TomlReader tr;
  ASSERT_TRUE(tr.load(f.path));
  ASSERT_EQ(tr.get_string("monitor", "log_path"), "/var/log/app.log");
  ASSERT_EQ(tr.get_int("monitor", "polling_interval_ms"), 250);
  ASSERT_EQ(tr.get_string("monitor", "webhook_url"), "https://hooks.example.com/T0/B0");
  ASSERT_TRUE(!tr.has("monitor", "pattern"));
}

TEST(toml_rule_tables_keep_declaration_order) {
  ConfigFile f("rules", kSampleConfig);
  TomlReader tr;
  ASSERT_TRUE(tr.load(f.path));
  auto rules = tr.section_names("rule.");
  ASSERT_EQ(rules.size(), size_t{2});
  ASSERT_EQ(rules[0], "rule.Panic");
  ASSERT_EQ(rules[1], "rule.Timeout");
  ASSERT_EQ(tr.section_names().size(), size_t{3});
}

TEST(toml_rule_patterns_literal_and_basic) {
  ConfigFile f("patterns", kSampleConfig);
  TomlReader tr;
  ASSERT_TRUE(tr.load(f.path));
  // Literal strings are verbatim; basic strings unescape "\\" to one backslash
  ASSERT_EQ(tr.get_string("rule.Panic", "pattern"), "(?i)panic");
  ASSERT_EQ(tr.get_string("rule.Timeout", "pattern"), "timed?\\s+out");
  ASSERT_EQ(tr.get_int("rule.Timeout", "threshold", 1), 5);
  ASSERT_EQ(tr.get_int("rule.Panic", "threshold", 1), 1);
}

TEST(toml_threshold_must_be_whole_integer) {
  ConfigFile f("ints",
    "[rule.A]\nthreshold = -3\n"
    "[rule.B]\nthreshold = +4\n"
    "[rule.C]\nthreshold = 12abc\n"
    "[rule.D]\nthreshold = \"\"\n");
  TomlReader tr;
  ASSERT_TRUE(tr.load(f.path));
  ASSERT_EQ(tr.get_int("rule.A", "threshold", 1), -3);
  ASSERT_EQ(tr.get_int("rule.B", "threshold", 1), 4);
  ASSERT_EQ(tr.get_int("rule.C", "threshold", 1), 1);
  ASSERT_EQ(tr.get_int("rule.D", "threshold", 1), 1);
}

TEST(toml_trailing_comments) {
  ConfigFile f("comments",
    "[monitor]\n"
    "polling_interval_ms = 50 # fast\n"
    "log_path = 'a#b.log' # hash inside quotes stays\n"
    "[rule.Hash]\n"
    "pattern = issue#42\n");
  TomlReader tr;
  ASSERT_TRUE(tr.load(f.path));
  ASSERT_EQ(tr.get_int("monitor", "polling_interval_ms"), 50);
  ASSERT_EQ(tr.get_string("monitor", "log_path"), "a#b.log");
  // '#' without leading whitespace is part of a bare value
  ASSERT_EQ(tr.get_string("rule.Hash", "pattern"), "issue#42");
}

TEST(toml_repeated_key_and_table_merge) {
  ConfigFile f("repeat",
    "[monitor]\nlog_path = first.log\n"
    "[rule.Error]\npattern = error\n"
    "[monitor]\nlog_path = second.log\n");
  TomlReader tr;
  ASSERT_TRUE(tr.load(f.path));
  ASSERT_EQ(tr.get_string("monitor", "log_path"), "second.log");
  auto names = tr.section_names();
  ASSERT_EQ(names.size(), size_t{2});
  ASSERT_EQ(names[0], "monitor");
}

TEST(toml_empty_rule_table_and_stray_lines) {
  ConfigFile f("stray",
    "not a key value line\n"
    "[rule.Empty]\n"
    "[ rule.Spaced ]\n"
    "pattern = x\n");
  TomlReader tr;
  ASSERT_TRUE(tr.load(f.path));
  ASSERT_TRUE(tr.has_section("rule.Empty"));
  ASSERT_TRUE(!tr.has("rule.Empty", "pattern"));
  ASSERT_EQ(tr.get_string("rule.Spaced", "pattern"), "x");
  ASSERT_EQ(tr.get_string("rule.Empty", "pattern", "none"), "none");
  ASSERT_TRUE(!tr.has_section(""));
}

TEST(toml_root_keys_before_first_table) {
  ConfigFile f("root", "log_path = top.log\n[monitor]\npolling_interval_ms = 20\n");
  TomlReader tr;
  ASSERT_TRUE(tr.load(f.path));
  ASSERT_EQ(tr.get_string("", "log_path"), "top.log");
  ASSERT_TRUE(!tr.has("monitor", "log_path"));
}
