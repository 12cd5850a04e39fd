#include "sources/FileTailer.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <thread>
#include <utility>

namespace sentinel::sources {

namespace {
constexpr size_t kReadChunk = 64 * 1024;
}

FileTailer::FileTailer(std::string path, TailStart start, std::chrono::milliseconds poll)
    : path_(std::move(path)), start_(start), poll_(poll) {}

FileTailer::~FileTailer() { close_fd(); }

bool FileTailer::open() {
  return open_current(start_ == TailStart::Beginning);
}

bool FileTailer::open_current(bool from_start) {
  close_fd();
  int fd = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) return false;
  struct stat st{};
  if (::fstat(fd, &st) != 0) {
    ::close(fd);
    return false;
  }
  fd_ = fd;
  ino_ = st.st_ino;
  dev_ = st.st_dev;
  offset_ = from_start ? 0 : st.st_size;
  partial_.clear();
  return true;
}

void FileTailer::close_fd() {
  if (fd_ >= 0) ::close(fd_);
  fd_ = -1;
}

bool FileTailer::fill() {
  if (fd_ < 0) return false;
  char buf[kReadChunk];
  ssize_t n;
  do {
    n = ::pread(fd_, buf, sizeof(buf), offset_);
  } while (n < 0 && errno == EINTR);
  if (n < 0) throw SourceError("read " + path_ + ": " + std::strerror(errno));
  if (n == 0) return false;
  partial_.append(buf, static_cast<size_t>(n));
  offset_ += n;
  return true;
}

size_t FileTailer::buffered_bytes() const {
  size_t total = partial_.size();
  for (const auto& l : ready_) total += l.size();
  return total;
}

void FileTailer::split_lines() {
  size_t begin = 0;
  for (;;) {
    size_t nl = partial_.find('\n', begin);
    if (nl == std::string::npos) break;
    size_t end = nl;
    if (end > begin && partial_[end - 1] == '\r') --end;
    ready_.emplace_back(partial_, begin, end - begin);
    begin = nl + 1;
  }
  partial_.erase(0, begin);
}

void FileTailer::check_rotation() {
  struct stat st{};
  if (::stat(path_.c_str(), &st) != 0) {
    // Renamed away and not recreated yet: keep the old fd and wait.
    if (errno == ENOENT) return;
    throw SourceError("stat " + path_ + ": " + std::strerror(errno));
  }
  if (fd_ >= 0 && (st.st_ino != ino_ || st.st_dev != dev_)) {
    // Drain the tail end of the old file before switching; a chunk at a time
    if (fill()) {
      split_lines();
      return;
    }
    if (!partial_.empty()) {
      ready_.push_back(std::move(partial_));
      partial_.clear();
    }
    ++rotations_;
    // If the new file vanished again, next_line() retries the open.
    (void)open_current(true);
    return;
  }
  if (st.st_size < offset_) {
    offset_ = 0;
    partial_.clear();
  }
}

std::optional<std::string> FileTailer::next_line(std::stop_token st) {
  while (!st.stop_requested()) {
    if (!ready_.empty()) {
      std::string line = std::move(ready_.front());
      ready_.pop_front();
      return line;
    }
    if (fd_ < 0 && !open_current(true)) {
      std::this_thread::sleep_for(poll_);
      continue;
    }
    if (fill()) {
      split_lines();
      continue;
    }
    check_rotation();
    if (ready_.empty()) std::this_thread::sleep_for(poll_);
  }
  return std::nullopt;
}

} // namespace sentinel::sources
