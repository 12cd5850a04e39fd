#include "minitest.hpp"
#include "app/SharedStats.hpp"
#include <thread>
#include <vector>

using sentinel::app::SharedStats;

TEST(stats_start_empty) {
  SharedStats s;
  auto snap = s.snapshot();
  ASSERT_EQ(snap.total_lines, uint64_t{0});
  ASSERT_EQ(snap.total_alerts, uint64_t{0});
  ASSERT_EQ(snap.notifications_sent, uint64_t{0});
  ASSERT_TRUE(!snap.last_alert);
  ASSERT_TRUE(!snap.since_last_notification);
}

TEST(stats_record_alert_replaces_last) {
  SharedStats s;
  s.record_line();
  s.record_alert("first");
  s.record_line();
  s.record_alert("second");
  ASSERT_EQ(s.total_lines(), uint64_t{2});
  ASSERT_EQ(s.total_alerts(), uint64_t{2});
  ASSERT_EQ(*s.last_alert(), "second");
}

TEST(stats_notification_time_reported) {
  SharedStats s;
  s.record_notification(std::chrono::steady_clock::now() - std::chrono::seconds(3));
  auto snap = s.snapshot();
  ASSERT_EQ(snap.notifications_sent, uint64_t{1});
  ASSERT_TRUE(snap.since_last_notification.has_value());
  ASSERT_TRUE(*snap.since_last_notification >= std::chrono::seconds(3));
}

TEST(stats_concurrent_writers_and_reader) {
  SharedStats s;
  constexpr int kThreads = 4;
  constexpr int kPer = 5000;
  std::vector<std::thread> ts;
  for (int t = 0; t < kThreads; ++t) {
    ts.emplace_back([&]{
      for (int i = 0; i < kPer; ++i) {
        s.record_line();
        if (i % 10 == 0) s.record_alert("alert " + std::to_string(i));
      }
    });
  }
  uint64_t last_seen = 0;
  for (int i = 0; i < 100; ++i) {
    auto snap = s.snapshot();
    ASSERT_TRUE(snap.total_lines >= last_seen);
    last_seen = snap.total_lines;
  }
  for (auto& t : ts) t.join();
  ASSERT_EQ(s.total_lines(), uint64_t{kThreads * kPer});
  ASSERT_EQ(s.total_alerts(), uint64_t{kThreads * kPer / 10});
}
