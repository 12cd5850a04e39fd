#include "ui/Input.hpp"
#include <algorithm>
#include <poll.h>
#include <unistd.h>

namespace sentinel::ui {

KeyAction poll_keys(int timeout_ms) {
  pollfd in{STDIN_FILENO, POLLIN, 0};
  if (::poll(&in, 1, std::clamp(timeout_ms, 10, 1000)) <= 0 || !(in.revents & POLLIN))
    return KeyAction::None;

  char keys[16];
  ssize_t got = ::read(STDIN_FILENO, keys, sizeof(keys));
  int toggles = 0;
  for (ssize_t i = 0; i < got; ++i) {
    switch (keys[i]) {
      case 'q': case 'Q': return KeyAction::Quit;
      case 'h': case 'H': ++toggles; break;
      default: break;
    }
  }
  // Two presses in one read cancel out
  return toggles % 2 ? KeyAction::ToggleHelp : KeyAction::None;
}

} // namespace sentinel::ui
