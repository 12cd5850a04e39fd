#include "app/ConfigError.hpp"
#include "app/IngestionPipeline.hpp"
#include "app/LineClassifier.hpp"
#include "app/MonitorConfig.hpp"
#include "app/NotificationGate.hpp"
#include "app/Notifier.hpp"
#include "app/PatternMatcher.hpp"
#include "app/SharedStats.hpp"
#include "app/Simulator.hpp"
#include "sources/FileTailer.hpp"
#include "ui/AlertHistory.hpp"
#include "ui/Config.hpp"
#include "ui/Input.hpp"
#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"
#include "util/DetachedTask.hpp"
#include <curl/curl.h>
#include <chrono>
#include <cstdio>
#include <fcntl.h>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>

using namespace sentinel::ui;

namespace {

struct CliOptions {
  std::optional<std::string> config_path;
  std::optional<std::string> log_path;
  bool simulate{false};
  int self_test_secs{0};
};

void print_usage() {
  std::cout << "Usage: sentinel [--config PATH] [--log PATH] [--simulate] [--self-test-seconds S]\n";
  std::cout << "Notes: the dashboard runs until q or Ctrl+C. --simulate writes synthetic traffic to the log file.\n";
}

// --config, else ./sentinel.toml when present, else the XDG/HOME location.
std::string resolve_config_path(const CliOptions& opt) {
  if (opt.config_path) return *opt.config_path;
  std::error_code ec;
  if (std::filesystem::exists("sentinel.toml", ec)) return "sentinel.toml";
  return sentinel::app::config_file_path();
}

// Webhook tasks may still be inside curl_easy_perform; libcurl's global
// state is torn down only once they have all returned.
constexpr auto kNotifyDrainLimit = std::chrono::seconds(3);

void release_curl() {
  if (sentinel::util::DetachedTask::wait_idle(kNotifyDrainLimit)) {
    curl_global_cleanup();
    return;
  }
  std::fprintf(stderr, "sentinel: %d notification(s) still in flight; skipping curl cleanup\n",
               sentinel::util::DetachedTask::in_flight());
}

// The tail source needs the path to exist before it opens it.
bool ensure_log_file(const std::string& path) {
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) return false;
  ::close(fd);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  CliOptions opt;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) opt.config_path = argv[++i];
    else if (a == "--log" && i + 1 < argc) opt.log_path = argv[++i];
    else if (a == "--simulate") opt.simulate = true;
    else if (a == "--self-test-seconds" && i + 1 < argc) {
      try { opt.self_test_secs = std::stoi(argv[++i]); }
      catch (const std::exception&) {
        std::fprintf(stderr, "sentinel: invalid --self-test-seconds value '%s'\n", argv[i]);
        return 2;
      }
    }
    else if (a == "-h" || a == "--help") { print_usage(); return 0; }
    else {
      std::fprintf(stderr, "sentinel: unknown argument '%s'\n", a.c_str());
      print_usage();
      return 2;
    }
  }

  // Everything that can reject the configuration happens before any thread starts
  sentinel::app::MonitorConfig cfg;
  std::unique_ptr<sentinel::app::PatternMatcher> matcher;
  try {
    cfg = sentinel::app::load_config(resolve_config_path(opt));
    if (opt.log_path) cfg.log_path = *opt.log_path;
    matcher = std::make_unique<sentinel::app::PatternMatcher>(cfg.rules);
  } catch (const sentinel::app::ConfigError& e) {
    std::fprintf(stderr, "sentinel: config error: %s\n", e.what());
    return 2;
  }

  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    std::fprintf(stderr, "sentinel: curl_global_init failed; notifications disabled\n");
    cfg.webhook_url.reset();
  }

  sentinel::app::Simulator simulator(cfg.log_path);
  if (opt.simulate && !simulator.start()) {
    std::fprintf(stderr, "sentinel: cannot write simulated log '%s'\n", cfg.log_path.c_str());
    curl_global_cleanup();
    return 1;
  }
  if (!ensure_log_file(cfg.log_path)) {
    std::fprintf(stderr, "sentinel: cannot create log file '%s'\n", cfg.log_path.c_str());
    curl_global_cleanup();
    return 1;
  }

  // Simulated traffic starts from an empty file and every line of it counts
  sentinel::sources::FileTailer tailer(cfg.log_path,
      opt.simulate ? sentinel::sources::TailStart::Beginning : sentinel::sources::TailStart::End);
  if (!tailer.open()) {
    std::fprintf(stderr, "sentinel: cannot open log file '%s'\n", cfg.log_path.c_str());
    simulator.stop();
    curl_global_cleanup();
    return 1;
  }

  sentinel::app::LineClassifier classifier(*matcher);
  sentinel::app::SharedStats stats;
  sentinel::app::NotificationGate gate;
  std::unique_ptr<sentinel::app::INotifier> notifier;
  if (cfg.webhook_url) notifier = std::make_unique<sentinel::app::WebhookNotifier>(*cfg.webhook_url);

  sentinel::app::IngestionPipeline pipeline(tailer, classifier, stats, gate, notifier.get());
  pipeline.start();

  auto shutdown = [&]{
    pipeline.stop();
    simulator.stop();
    release_curl();
  };
  auto report_termination = [&]{
    std::fprintf(stderr, "sentinel: pipeline stopped: %s\n", pipeline.termination_reason().c_str());
  };

  install_signal_handlers();

  if (opt.self_test_secs > 0) {
    using clock = std::chrono::steady_clock;
    auto start = clock::now();
    auto endt  = start + std::chrono::seconds(opt.self_test_secs);
    while (clock::now() < endt && !g_stop.load() && !pipeline.terminated()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (pipeline.terminated()) {
      report_termination();
      shutdown();
      return 1;
    }
    auto s = stats.snapshot();
    double secs = std::chrono::duration<double>(clock::now() - start).count();
    std::cout << "Self-test: lines=" << s.total_lines << " alerts=" << s.total_alerts
              << " notifications=" << s.notifications_sent << " in " << secs << "s\n";
    shutdown();
    return 0;
  }

  int exit_code = 0;
  {
    TerminalSession term(ui_config().alt_screen);
    term.clear();
    const bool interactive = ::isatty(STDIN_FILENO) == 1;
    const int tick_ms = cfg.polling_interval_ms;
    bool show_help = false;
    const std::string help_text = "Keys: q quit  h help   log: " + cfg.log_path +
        (notifier ? "   webhook: on" : "   webhook: off");
    AlertHistory history;
    while (!g_stop.load()) {
      if (interactive) {
        auto key = poll_keys(tick_ms);
        if (key == KeyAction::Quit) break;
        if (key == KeyAction::ToggleHelp) show_help = !show_help;
      } else {
        std::this_thread::sleep_for(std::chrono::milliseconds(tick_ms));
      }
      if (pipeline.terminated()) { exit_code = 1; break; }
      auto s = stats.snapshot();
      history.observe(s.total_alerts);
      render_screen(s, history, show_help, help_text);
    }
  }
  // Session is gone; the terminal is back to normal for the final message
  if (exit_code != 0) report_termination();
  shutdown();
  return exit_code;
}
