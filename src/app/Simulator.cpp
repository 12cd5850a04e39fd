#include "app/Simulator.hpp"
#include <chrono>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <fstream>

namespace sentinel::app {

Simulator::Simulator(std::string path) : path_(std::move(path)) {}

Simulator::~Simulator() { stop(); }

std::string Simulator::line_for(uint64_t n) {
  auto num = std::to_string(n);
  // Panic takes precedence where the cadences meet (3500, 7000, ...)
  if (n % 500 == 0) return "panic!: Kernel panic at main.rs:" + num;
  if (n % 700 == 0) return "{\"level\": \"error\", \"msg\": \"Critical usage " + num + "\"}";
  if (n % 100 == 0) return "[ERROR] Database connection failed for user_id=" + num;
  return "[INFO] System healthy " + num;
}

bool Simulator::start() {
  if (thread_.joinable()) return true;
  {
    std::ofstream trunc(path_, std::ios::trunc);
    if (!trunc) {
      std::fprintf(stderr, "sentinel: simulator: cannot create %s: %s\n", path_.c_str(), std::strerror(errno));
      return false;
    }
  }
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
  return true;
}

void Simulator::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
}

void Simulator::run(std::stop_token st) {
  std::ofstream out(path_, std::ios::app);
  if (!out) {
    std::fprintf(stderr, "sentinel: simulator: cannot open %s: %s\n", path_.c_str(), std::strerror(errno));
    return;
  }
  uint64_t n = 0;
  while (!st.stop_requested()) {
    ++n;
    out << line_for(n) << '\n';
    if (n % 100 == 0) {
      out.flush();
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }
  out.flush();
}

} // namespace sentinel::app
