#include "util/DetachedTask.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdio>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

namespace sentinel::util {

static std::atomic<int> g_in_flight{0};
static std::mutex g_idle_mu;
static std::condition_variable g_idle_cv;

static void finish_one() {
  if (g_in_flight.fetch_sub(1, std::memory_order_acq_rel) == 1) {
    std::lock_guard<std::mutex> lk(g_idle_mu);
    g_idle_cv.notify_all();
  }
}

bool DetachedTask::spawn(std::string label, std::function<void()> work) {
  g_in_flight.fetch_add(1, std::memory_order_relaxed);
  try {
    std::thread t([label = std::move(label), work = std::move(work)]() {
      try {
        work();
      } catch (const std::exception& e) {
        std::fprintf(stderr, "sentinel: task %s failed: %s\n", label.c_str(), e.what());
      }
      finish_one();
    });
    t.detach();
  } catch (const std::system_error& e) {
    finish_one();
    std::fprintf(stderr, "sentinel: cannot spawn task: %s\n", e.what());
    return false;
  }
  return true;
}

int DetachedTask::in_flight() { return g_in_flight.load(std::memory_order_acquire); }

bool DetachedTask::wait_idle(std::chrono::milliseconds limit) {
  std::unique_lock<std::mutex> lk(g_idle_mu);
  return g_idle_cv.wait_for(lk, limit, [] { return g_in_flight.load(std::memory_order_acquire) == 0; });
}

} // namespace sentinel::util
