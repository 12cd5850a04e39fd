#include "minitest.hpp"
#include "ui/Formatting.hpp"
#include "ui/Renderer.hpp"
#include "util/Retro.hpp"
#include <cstdlib>

using namespace sentinel::ui;

// Formatting picks ASCII or UTF-8 ellipses from the locale
static void force_ascii() {
  ::setenv("LC_ALL", "C", 1);
}

TEST(fmt_display_cols_ignores_sgr_and_counts_utf8) {
  ASSERT_EQ(display_cols("abc"), 3);
  ASSERT_EQ(display_cols("\x1B[31mred\x1B[0m"), 3);
  ASSERT_EQ(display_cols("▁▂▃"), 3);
}

TEST(fmt_fit_width) {
  force_ascii();
  ASSERT_EQ(fit_width("abc", 5), "abc  ");
  ASSERT_EQ(fit_width("abcdef", 4), "abc.");
  ASSERT_EQ(fit_width("abc", 0), "");
  ASSERT_EQ(fit_width("abcdef", 1), "a");
}

TEST(fmt_take_cols_keeps_escapes_and_whole_code_points) {
  ASSERT_EQ(take_cols("\x1B[1mbold\x1B[0m", 2), "\x1B[1mbo");
  ASSERT_EQ(take_cols("▁▂▃", 2), "▁▂");
  ASSERT_EQ(take_cols("abc", 0), "");
}

TEST(fmt_spread) {
  force_ascii();
  ASSERT_EQ(spread(12, "Lines", "42"), "Lines     42");
  // Left side gives way; right side stays whole
  ASSERT_EQ(spread(8, "Notifications", "123"), "Not. 123");
}

TEST(fmt_elapsed) {
  ASSERT_EQ(format_elapsed(std::chrono::seconds(42)), "42s");
  ASSERT_EQ(format_elapsed(std::chrono::seconds(187)), "3m 07s");
  ASSERT_EQ(format_elapsed(std::chrono::seconds(7509)), "2h 05m 09s");
}

TEST(fmt_rate) {
  ASSERT_EQ(format_rate(500, std::chrono::milliseconds(400)), "0.0");
  ASSERT_EQ(format_rate(1500, std::chrono::milliseconds(2000)), "750.0");
}

TEST(fmt_wrap_lines) {
  force_ascii();
  auto w = wrap_lines("Sentinel Alert: pattern match (Error)\nLog: x", 20, 10);
  ASSERT_EQ(w.size(), size_t{3});
  ASSERT_EQ(w[0], "Sentinel Alert: patt");
  ASSERT_EQ(w[1], "ern match (Error)");
  ASSERT_EQ(w[2], "Log: x");
  auto clipped = wrap_lines("a\nb\nc\nd", 10, 2);
  ASSERT_EQ(clipped.size(), size_t{2});
  ASSERT_EQ(clipped[1], "b.");
}

TEST(retro_sparkline_scales_to_peak) {
  auto s = sentinel::util::retro_sparkline({0, 4, 8}, 5, false);
  ASSERT_EQ(s, "  _=#");
  // Only the newest width values are drawn
  auto t = sentinel::util::retro_sparkline({8, 0, 0}, 2, false);
  ASSERT_EQ(t, "__");
}

TEST(retro_bar_fill) {
  ASSERT_EQ(sentinel::util::retro_bar(50.0, 4, "#", "-"), " ##-- ");
  ASSERT_EQ(sentinel::util::retro_bar(250.0, 2, "#", "-"), " ## ");
}

TEST(make_box_shape) {
  force_ascii();
  auto box = make_box("Last Alert", {" No alerts yet."}, 24, 2);
  ASSERT_EQ(box.size(), size_t{4});
  ASSERT_EQ(box[0], "+----[ Last Alert ]----+");
  ASSERT_EQ(box[1], "| No alerts yet.       |");
  ASSERT_EQ(box[3], "+----------------------+");
}
