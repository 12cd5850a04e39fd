#include "app/Notifier.hpp"
#include "util/DetachedTask.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <utility>

namespace sentinel::app {

namespace {

size_t discard_body(char*, size_t size, size_t nmemb, void*) { return size * nmemb; }

// Blocking POST; runs on the detached task only.
CURLcode post_json(const std::string& url, const std::string& body, long timeout_secs) {
  CURL* c = curl_easy_init();
  if (!c) return CURLE_FAILED_INIT;
  struct curl_slist* hdrs = nullptr;
  hdrs = curl_slist_append(hdrs, "Content-Type: application/json");
  curl_easy_setopt(c, CURLOPT_URL, url.c_str());
  curl_easy_setopt(c, CURLOPT_HTTPHEADER, hdrs);
  curl_easy_setopt(c, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, discard_body);
  curl_easy_setopt(c, CURLOPT_TIMEOUT, timeout_secs);
  curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
  CURLcode rc = curl_easy_perform(c);
  curl_slist_free_all(hdrs);
  curl_easy_cleanup(c);
  return rc;
}

} // namespace

std::string format_alert_text(const model::Classification& c, const PatternMatcher& matcher) {
  constexpr std::string_view kStructuredPrefix = "structured: ";
  switch (c.origin) {
    case model::AlertOrigin::Structured: {
      std::string_view msg = c.message;
      if (msg.starts_with(kStructuredPrefix)) msg.remove_prefix(kStructuredPrefix.size());
      return "Sentinel Alert: structured error detected\nMessage: " + std::string(msg);
    }
    case model::AlertOrigin::Pattern: {
      std::string rule = (c.rule_index && *c.rule_index < matcher.size())
                             ? matcher.rule(*c.rule_index).name : std::string("?");
      return "Sentinel Alert: pattern match (" + rule + ")\nLog: " + c.message;
    }
    case model::AlertOrigin::None:
      break;
  }
  return "Sentinel Alert: " + c.message;
}

std::string webhook_payload(const std::string& text) {
  nlohmann::json body = {{"text", text}};
  // Replace invalid UTF-8 from raw log lines instead of throwing.
  return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

WebhookNotifier::WebhookNotifier(std::string url, long timeout_secs)
    : url_(std::move(url)), timeout_secs_(timeout_secs) {}

void WebhookNotifier::dispatch(std::string text) {
  (void)util::DetachedTask::spawn("webhook", [url = url_, body = webhook_payload(text), timeout = timeout_secs_]() {
    // Transport errors are dropped: no retry, no effect on pipeline state.
    (void)post_json(url, body, timeout);
  });
}

} // namespace sentinel::app
