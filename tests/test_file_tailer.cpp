#include "minitest.hpp"
#include "StderrCapture.hpp"
#include "sources/FileTailer.hpp"
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stop_token>
#include <string>
#include <thread>

using sentinel::sources::FileTailer;
using sentinel::sources::TailStart;
using namespace std::chrono_literals;

namespace {

std::string tmp_log(const char* suffix) {
  return std::string("/tmp/sentinel_test_tail_") + suffix + ".log";
}

void append(const std::string& path, const std::string& text) {
  std::ofstream f(path, std::ios::app | std::ios::binary);
  f << text;
}

void overwrite(const std::string& path, const std::string& text) {
  std::ofstream f(path, std::ios::trunc | std::ios::binary);
  f << text;
}

void remove_file(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

// next_line() with a watchdog so a broken tailer fails instead of hanging.
std::optional<std::string> next_within(FileTailer& t, std::chrono::milliseconds limit = 2000ms) {
  std::stop_source ss;
  std::jthread watchdog([&ss, limit](std::stop_token wst) {
    auto end = std::chrono::steady_clock::now() + limit;
    while (!wst.stop_requested() && std::chrono::steady_clock::now() < end) std::this_thread::sleep_for(5ms);
    ss.request_stop();
  });
  return t.next_line(ss.get_token());
}

} // namespace

TEST(tail_missing_file_fails_open) {
  FileTailer t("/tmp/sentinel_test_tail_does_not_exist.log");
  ASSERT_TRUE(!t.open());
}

TEST(tail_starts_at_end_by_default) {
  auto path = tmp_log("end");
  overwrite(path, "old line\n");
  FileTailer t(path, TailStart::End, 5ms);
  ASSERT_TRUE(t.open());
  append(path, "new line\n");
  auto l = next_within(t);
  ASSERT_TRUE(l.has_value());
  ASSERT_EQ(*l, "new line");
  remove_file(path);
}

TEST(tail_from_beginning_and_partial_lines) {
  auto path = tmp_log("begin");
  overwrite(path, "one\r\ntwo\nthr");
  FileTailer t(path, TailStart::Beginning, 5ms);
  ASSERT_TRUE(t.open());
  ASSERT_EQ(next_within(t).value_or("<timeout>"), "one");
  ASSERT_EQ(next_within(t).value_or("<timeout>"), "two");
  // Incomplete line is held back until its newline arrives
  ASSERT_TRUE(!next_within(t, 50ms));
  append(path, "ee\n");
  ASSERT_EQ(next_within(t).value_or("<timeout>"), "three");
  remove_file(path);
}

TEST(tail_backlog_is_delivered_while_reading) {
  auto path = tmp_log("backlog");
  // ~1.2 MB of 120-byte lines already on disk
  std::string line(119, 'x');
  std::string text;
  for (int i = 0; i < 10000; ++i) text += line + "\n";
  overwrite(path, text);
  FileTailer t(path, TailStart::Beginning, 5ms);
  ASSERT_TRUE(t.open());
  ASSERT_EQ(next_within(t).value_or("<timeout>"), line);
  // Only the first chunk has been read so far
  ASSERT_TRUE(t.buffered_bytes() <= size_t{64 * 1024});
  // One watchdog for the whole drain
  std::stop_source ss;
  std::jthread watchdog([&ss](std::stop_token wst) {
    auto end = std::chrono::steady_clock::now() + 10s;
    while (!wst.stop_requested() && std::chrono::steady_clock::now() < end) std::this_thread::sleep_for(5ms);
    ss.request_stop();
  });
  size_t seen = 1;
  while (seen < 10000) {
    auto l = t.next_line(ss.get_token());
    if (!l) break;
    ASSERT_EQ(l->size(), size_t{119});
    ASSERT_TRUE(t.buffered_bytes() <= size_t{64 * 1024});
    ++seen;
  }
  ASSERT_EQ(seen, size_t{10000});
  ASSERT_EQ(t.buffered_bytes(), size_t{0});
  remove_file(path);
}

TEST(tail_truncation_rereads_from_start) {
  auto path = tmp_log("trunc");
  overwrite(path, "");
  FileTailer t(path, TailStart::End, 5ms);
  ASSERT_TRUE(t.open());
  append(path, "aaaa\nbbbb\n");
  ASSERT_EQ(next_within(t).value_or("<timeout>"), "aaaa");
  ASSERT_EQ(next_within(t).value_or("<timeout>"), "bbbb");
  overwrite(path, "c\n");
  ASSERT_EQ(next_within(t).value_or("<timeout>"), "c");
  remove_file(path);
}

TEST(tail_rotation_drains_old_then_reads_new) {
  auto path = tmp_log("rot");
  auto rotated = path + ".1";
  remove_file(rotated);
  overwrite(path, "");
  FileTailer t(path, TailStart::End, 5ms);
  ASSERT_TRUE(t.open());
  append(path, "before\n");
  ASSERT_EQ(next_within(t).value_or("<timeout>"), "before");

  std::filesystem::rename(path, rotated);
  append(rotated, "late write\n");
  overwrite(path, "after 1\nafter 2\n");

  ASSERT_EQ(next_within(t).value_or("<timeout>"), "late write");
  ASSERT_EQ(next_within(t).value_or("<timeout>"), "after 1");
  ASSERT_EQ(next_within(t).value_or("<timeout>"), "after 2");
  ASSERT_EQ(t.rotations(), uint64_t{1});
  remove_file(path);
  remove_file(rotated);
}

TEST(tail_rotation_and_truncation_are_silent) {
  auto path = tmp_log("quiet");
  auto rotated = path + ".1";
  remove_file(rotated);
  overwrite(path, "");
  FileTailer t(path, TailStart::End, 5ms);
  ASSERT_TRUE(t.open());
  StderrCapture cap;
  ASSERT_TRUE(cap.active());
  append(path, "one\ntwo\n");
  auto a = next_within(t);
  auto b = next_within(t);
  overwrite(path, "x\n");
  auto c = next_within(t);
  std::filesystem::rename(path, rotated);
  overwrite(path, "y\n");
  auto d = next_within(t);
  auto written = cap.text();
  ASSERT_EQ(a.value_or("<timeout>"), "one");
  ASSERT_EQ(b.value_or("<timeout>"), "two");
  ASSERT_EQ(c.value_or("<timeout>"), "x");
  ASSERT_EQ(d.value_or("<timeout>"), "y");
  ASSERT_EQ(t.rotations(), uint64_t{1});
  ASSERT_EQ(written, "");
  remove_file(path);
  remove_file(rotated);
}

TEST(tail_stop_request_returns_nullopt) {
  auto path = tmp_log("stop");
  overwrite(path, "");
  FileTailer t(path, TailStart::End, 5ms);
  ASSERT_TRUE(t.open());
  std::stop_source ss;
  ss.request_stop();
  ASSERT_TRUE(!t.next_line(ss.get_token()));
  remove_file(path);
}
