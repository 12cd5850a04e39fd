#pragma once
#include "sources/ILineSource.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <string>
#include <sys/types.h>

namespace sentinel::sources {

enum class TailStart { End, Beginning };

// Polling tail -F over a single path.
//  - rename-and-recreate rotation: the old file is drained, then the new one
//    is read from its start;
//  - truncation (size below our offset): re-read from the start;
//  - path missing for a while: wait for it to come back.
// Reads go a chunk at a time, so a large backlog is split and delivered as
// it is read rather than buffered whole.
class FileTailer : public ILineSource {
public:
  explicit FileTailer(std::string path, TailStart start = TailStart::End,
                      std::chrono::milliseconds poll = std::chrono::milliseconds(25));
  ~FileTailer() override;
  FileTailer(const FileTailer&) = delete;
  FileTailer& operator=(const FileTailer&) = delete;

  [[nodiscard]] bool open() override;
  [[nodiscard]] std::optional<std::string> next_line(std::stop_token st) override;
  [[nodiscard]] const char* name() const override { return "file"; }

  [[nodiscard]] const std::string& path() const { return path_; }
  [[nodiscard]] uint64_t rotations() const { return rotations_; }
  // Bytes read from the file but not yet handed out by next_line().
  [[nodiscard]] size_t buffered_bytes() const;

private:
  bool open_current(bool from_start);
  void close_fd();
  // Read at most one chunk; true if any bytes arrived.
  bool fill();
  // Handle rotation/truncation when the fd is idle.
  void check_rotation();
  void split_lines();

  std::string path_;
  TailStart start_;
  std::chrono::milliseconds poll_;
  int fd_{-1};
  ino_t ino_{0};
  dev_t dev_{0};
  off_t offset_{0};
  std::string partial_;
  std::deque<std::string> ready_;
  uint64_t rotations_{0};
};

} // namespace sentinel::sources
