#pragma once
#include "app/PatternMatcher.hpp"
#include "model/Classification.hpp"
#include <string>

namespace sentinel::app {

// Outbound alert channel. dispatch() must return without waiting on the
// network; delivery success or failure never reaches the caller.
class INotifier {
public:
  virtual ~INotifier() = default;
  virtual void dispatch(std::string text) = 0;
  [[nodiscard]] virtual const char* name() const = 0;
};

// Human-readable notification text for an alert classification.
[[nodiscard]] std::string format_alert_text(const model::Classification& c, const PatternMatcher& matcher);

// {"text": "..."} request body.
[[nodiscard]] std::string webhook_payload(const std::string& text);

// POSTs webhook_payload(text) to a fixed URL with libcurl on a DetachedTask.
// No auth, no retry, response ignored.
class WebhookNotifier : public INotifier {
public:
  explicit WebhookNotifier(std::string url, long timeout_secs = 10);
  void dispatch(std::string text) override;
  [[nodiscard]] const char* name() const override { return "webhook"; }
  [[nodiscard]] const std::string& url() const { return url_; }

private:
  std::string url_;
  long timeout_secs_;
};

} // namespace sentinel::app
