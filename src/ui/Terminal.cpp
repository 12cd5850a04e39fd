#include "ui/Terminal.hpp"
#include "util/AsciiLower.hpp"
#include "util/Env.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace sentinel::ui {

std::atomic<bool> g_stop{false};

namespace {

constexpr std::string_view kAltOn = "\x1B[?1049h";
constexpr std::string_view kAltOff = "\x1B[?1049l";
constexpr std::string_view kCursorOff = "\x1B[?25l";
// Cursor back, attributes reset
constexpr std::string_view kCursorOnReset = "\x1B[?25h\x1B[0m";

// Read from the signal handler, so plain lock-free flags only
std::atomic<bool> g_session_live{false};
std::atomic<bool> g_session_alt{false};

// Async-signal-safe: write(2) only
void restore_screen() {
  if (!g_session_live.exchange(false)) return;
  if (g_session_alt.load()) (void)::write(STDOUT_FILENO, kAltOff.data(), kAltOff.size());
  (void)::write(STDOUT_FILENO, kCursorOnReset.data(), kCursorOnReset.size());
}

void on_stop_signal(int) {
  restore_screen();
  g_stop.store(true);
}

void on_exit_restore() { restore_screen(); }

int env_dimension(const char* name, int fallback) {
  int v = util::getenv_int(name, 0);
  return v > 0 ? v : fallback;
}

} // namespace

void install_signal_handlers() {
  struct sigaction sa{};
  sa.sa_handler = on_stop_signal;
  sigemptyset(&sa.sa_mask);
  (void)::sigaction(SIGINT, &sa, nullptr);
  (void)::sigaction(SIGTERM, &sa, nullptr);
}

bool stdout_is_tty() { return ::isatty(STDOUT_FILENO) == 1; }

bool utf8_locale() {
  const char* lc = std::getenv("LC_ALL");
  if (!lc || !*lc) lc = std::getenv("LANG");
  if (!lc) return false;
  auto s = util::ascii_lower(lc);
  return s.find("utf-8") != std::string::npos || s.find("utf8") != std::string::npos;
}

TermSize terminal_size() {
  struct winsize ws{};
  if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0)
    return {ws.ws_col, ws.ws_row};
  return {env_dimension("COLUMNS", 80), env_dimension("LINES", 24)};
}

std::string sgr(std::string_view params) {
  if (!stdout_is_tty()) return {};
  std::string out = "\x1B[";
  out.append(params);
  out.push_back('m');
  return out;
}

std::string fg_color(int idx) {
  if (idx < 8) return sgr(std::to_string(30 + std::max(idx, 0)));
  if (idx < 16) return sgr(std::to_string(90 + idx - 8));
  return sgr("38;5;" + std::to_string(idx));
}

void write_stdout(std::string_view bytes) {
  while (!bytes.empty()) {
    ssize_t n = ::write(STDOUT_FILENO, bytes.data(), bytes.size());
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return;
    bytes.remove_prefix(static_cast<size_t>(n));
  }
}

TerminalSession::TerminalSession(bool alt_screen) : tty_(stdout_is_tty()) {
  if (::isatty(STDIN_FILENO) == 1 && ::tcgetattr(STDIN_FILENO, &saved_tio_) == 0) {
    termios tio = saved_tio_;
    tio.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO);
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;
    if (::tcsetattr(STDIN_FILENO, TCSANOW, &tio) == 0) {
      stdin_raw_ = true;
      saved_fl_ = ::fcntl(STDIN_FILENO, F_GETFL, 0);
      if (saved_fl_ >= 0) (void)::fcntl(STDIN_FILENO, F_SETFL, saved_fl_ | O_NONBLOCK);
    }
  }
  if (!tty_) return;
  alt_ = alt_screen;
  g_session_alt.store(alt_);
  g_session_live.store(true);
  static const bool hooked = std::atexit(on_exit_restore) == 0;
  (void)hooked;
  std::string seq;
  if (alt_) seq.append(kAltOn);
  seq.append(kCursorOff);
  write_stdout(seq);
}

TerminalSession::~TerminalSession() {
  if (stdin_raw_) {
    (void)::tcsetattr(STDIN_FILENO, TCSANOW, &saved_tio_);
    if (saved_fl_ >= 0) (void)::fcntl(STDIN_FILENO, F_SETFL, saved_fl_);
  }
  if (tty_) restore_screen();
}

void TerminalSession::clear() const {
  if (tty_) write_stdout("\x1B[2J\x1B[H");
}

} // namespace sentinel::ui
