#include "app/IngestionPipeline.hpp"
#include <chrono>
#include <exception>
#include <utility>

namespace sentinel::app {

IngestionPipeline::IngestionPipeline(sources::ILineSource& source, const LineClassifier& classifier,
                                     SharedStats& stats, NotificationGate& gate, INotifier* notifier)
    : source_(source), classifier_(classifier), stats_(stats), gate_(gate), notifier_(notifier) {}

IngestionPipeline::~IngestionPipeline() { stop(); }

void IngestionPipeline::start() {
  if (thread_.joinable()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void IngestionPipeline::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
}

model::Classification IngestionPipeline::process_line(std::string_view line) {
  stats_.record_line();
  auto c = classifier_.classify(line);
  if (!c.is_alert) return c;

  stats_.record_alert(c.message);
  if (notifier_ && gate_.should_notify()) {
    stats_.record_notification(std::chrono::steady_clock::now());
    // Returns immediately; delivery happens on a detached task.
    notifier_->dispatch(format_alert_text(c, classifier_.matcher()));
  }
  return c;
}

void IngestionPipeline::run(std::stop_token st) {
  try {
    while (!st.stop_requested()) {
      auto line = source_.next_line(st);
      if (!line) {
        if (!st.stop_requested()) terminate(std::string(source_.name()) + " source: end of stream");
        return;
      }
      (void)process_line(*line);
    }
  } catch (const sources::SourceError& e) {
    terminate(std::string(source_.name()) + " source failed: " + e.what());
  } catch (const std::exception& e) {
    terminate(std::string("processing failed: ") + e.what());
  }
}

void IngestionPipeline::terminate(std::string reason) {
  {
    std::lock_guard<std::mutex> lk(reason_mu_);
    reason_ = std::move(reason);
  }
  terminated_.store(true, std::memory_order_release);
}

std::string IngestionPipeline::termination_reason() const {
  std::lock_guard<std::mutex> lk(reason_mu_);
  return reason_;
}

} // namespace sentinel::app
