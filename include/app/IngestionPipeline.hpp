#pragma once
#include "app/LineClassifier.hpp"
#include "app/NotificationGate.hpp"
#include "app/Notifier.hpp"
#include "app/SharedStats.hpp"
#include "sources/ILineSource.hpp"
#include <atomic>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

namespace sentinel::app {

// Pull loop: one dedicated thread takes lines from the source strictly in
// delivery order and fully processes each before asking for the next.
// The loop has no states besides running; when the source ends or fails the
// pipeline is terminated for good and the owner decides what to do.
class IngestionPipeline {
public:
  // notifier may be null when no notification target is configured.
  IngestionPipeline(sources::ILineSource& source, const LineClassifier& classifier,
                    SharedStats& stats, NotificationGate& gate, INotifier* notifier);
  ~IngestionPipeline();
  IngestionPipeline(const IngestionPipeline&) = delete;
  IngestionPipeline& operator=(const IngestionPipeline&) = delete;

  void start();
  void stop();

  // One line through count -> classify -> record -> gate -> dispatch.
  // Returns the classification for callers that want it.
  model::Classification process_line(std::string_view line);

  // Set once the loop has exited because the source ended or failed.
  [[nodiscard]] bool terminated() const { return terminated_.load(std::memory_order_acquire); }
  [[nodiscard]] std::string termination_reason() const;

private:
  void run(std::stop_token st);
  void terminate(std::string reason);

  sources::ILineSource& source_;
  const LineClassifier& classifier_;
  SharedStats& stats_;
  NotificationGate& gate_;
  INotifier* notifier_;
  std::atomic<bool> terminated_{false};
  mutable std::mutex reason_mu_;
  std::string reason_;
  std::jthread thread_{};
};

} // namespace sentinel::app
