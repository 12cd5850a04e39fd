#include "ui/Config.hpp"
#include "ui/Terminal.hpp"
#include "util/Env.hpp"

namespace sentinel::ui {

static bool env_flag(const char* name, bool defv) {
  const char* v = sentinel::util::getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F') return false;
  return true;
}

// Palette index from env, or the compiled default
static std::string resolve_color(const char* env_name, int def_palette_idx) {
  int idx = sentinel::util::getenv_int(env_name, def_palette_idx);
  if (idx < 0 || idx > 255) idx = def_palette_idx;
  return fg_color(idx);
}

const UIConfig& ui_config() {
  static UIConfig uic = []{
    UIConfig c{};
    c.accent  = resolve_color("SENTINEL_ACCENT_IDX", 11);
    c.warning = resolve_color("SENTINEL_WARNING_IDX", 1);
    c.muted   = resolve_color("SENTINEL_MUTED_IDX", 8);
    c.alt_screen = env_flag("SENTINEL_ALT_SCREEN", true);
    return c;
  }();
  return uic;
}

} // namespace sentinel::ui
