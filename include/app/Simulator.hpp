#pragma once
#include <cstdint>
#include <stop_token>
#include <string>
#include <thread>

namespace sentinel::app {

// Synthetic log traffic for demos: truncates the file and appends a steady
// stream of INFO lines with periodic errors, panics and JSON error records.
class Simulator {
public:
  explicit Simulator(std::string path);
  ~Simulator();
  Simulator(const Simulator&) = delete;
  Simulator& operator=(const Simulator&) = delete;

  // Truncates the file synchronously; returns false if it cannot be created.
  bool start();
  void stop();

  // Line number n (1-based) of the synthetic stream, without newline.
  [[nodiscard]] static std::string line_for(uint64_t n);

private:
  void run(std::stop_token st);

  std::string path_;
  std::jthread thread_;
};

} // namespace sentinel::app
