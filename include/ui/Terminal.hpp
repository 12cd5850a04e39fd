#pragma once

#include <atomic>
#include <string>
#include <string_view>
#include <termios.h>

namespace sentinel::ui {

// Set by SIGINT/SIGTERM; the dashboard loop polls it.
extern std::atomic<bool> g_stop;

// Routes SIGINT and SIGTERM to a handler that restores the screen and sets g_stop.
void install_signal_handlers();

[[nodiscard]] bool stdout_is_tty();
// LC_ALL, else LANG, names a UTF-8 locale.
[[nodiscard]] bool utf8_locale();

struct TermSize { int cols; int rows; };
// TIOCGWINSZ, else $COLUMNS/$LINES, else 80x24.
[[nodiscard]] TermSize terminal_size();

// SGR escape for a palette foreground (0-255) or raw parameters such as "1".
// Both are empty when stdout is not a tty.
[[nodiscard]] std::string fg_color(int palette_idx);
[[nodiscard]] std::string sgr(std::string_view params);
[[nodiscard]] inline std::string sgr_reset() { return sgr("0"); }

// Writes all of bytes to stdout, retrying short writes; gives up on error.
void write_stdout(std::string_view bytes);

// Terminal state for the dashboard's lifetime: stdin without echo or line
// buffering, a hidden cursor and (optionally) the alternate screen. Restored
// on destruction, on SIGINT/SIGTERM and from an atexit hook.
class TerminalSession {
public:
  explicit TerminalSession(bool alt_screen);
  ~TerminalSession();
  TerminalSession(const TerminalSession&) = delete;
  TerminalSession& operator=(const TerminalSession&) = delete;

  [[nodiscard]] bool alt_screen() const { return alt_; }
  void clear() const;

private:
  bool stdin_raw_{false};
  termios saved_tio_{};
  int saved_fl_{0};
  bool tty_{false};
  bool alt_{false};
};

} // namespace sentinel::ui
