#pragma once

#include "sato/alerts/alert_group.hpp"
#include "sato/common/result.hpp"
#include "sato/config/schema.hpp"
#include "sato/net/http_client.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace sato::alerts {

/// Outbound notification hook. Implementations must not block the caller
/// for network round trips.
class INotifier {
public:
  virtual ~INotifier() = default;

  [[nodiscard]] virtual common::Status notify(const Notification &notification) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
  /// Waits for queued deliveries; false when `timeout` passed first.
  virtual bool flush(std::chrono::milliseconds /*timeout*/) { return true; }
};

class LogNotifier final : public INotifier {
public:
  explicit LogNotifier(std::ostream *out = nullptr);

  [[nodiscard]] common::Status notify(const Notification &notification) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  std::ostream *out_;
  std::mutex mutex_;
};

class MultiNotifier final : public INotifier {
public:
  explicit MultiNotifier(std::vector<std::unique_ptr<INotifier>> notifiers);

  /// Every notifier is tried; the first error is returned.
  [[nodiscard]] common::Status notify(const Notification &notification) override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }
  bool flush(std::chrono::milliseconds timeout) override;
  [[nodiscard]] std::size_t size() const { return notifiers_.size(); }

private:
  std::vector<std::unique_ptr<INotifier>> notifiers_;
};

enum class WebhookFormat { Generic, Slack, Discord };

[[nodiscard]] common::Result<WebhookFormat> parse_webhook_format(const std::string &value);

struct WebhookOptions {
  std::string url;
  WebhookFormat format = WebhookFormat::Generic;
  /// When non-empty the body is signed into X-Sato-Signature.
  std::string secret;
  std::uint64_t timeout_ms = 10000;
  std::size_t max_queue = 256;
};

[[nodiscard]] std::string build_webhook_payload(const Notification &notification,
                                                WebhookFormat format);

/// Hex HMAC-SHA256 of `body` keyed by `secret`, prefixed "sha256=".
[[nodiscard]] std::string sign_payload(const std::string &secret, const std::string &body);

/// Posts notifications from a background thread so a slow endpoint never
/// stalls the monitor loop.
class WebhookNotifier final : public INotifier {
public:
  WebhookNotifier(WebhookOptions options, std::shared_ptr<net::HttpClient> http);
  ~WebhookNotifier() override;

  WebhookNotifier(const WebhookNotifier &) = delete;
  WebhookNotifier &operator=(const WebhookNotifier &) = delete;

  /// Queues the payload; fails only when the queue is full or stopped.
  [[nodiscard]] common::Status notify(const Notification &notification) override;
  [[nodiscard]] std::string_view name() const override { return "webhook"; }

  bool flush(std::chrono::milliseconds timeout) override;
  void stop();

  [[nodiscard]] std::uint64_t delivered() const { return delivered_; }
  [[nodiscard]] std::uint64_t failed() const { return failed_; }

private:
  void deliver_loop();
  void deliver(const std::string &body);

  WebhookOptions options_;
  std::shared_ptr<net::HttpClient> http_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::string> queue_;
  bool busy_ = false;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> delivered_{0};
  std::atomic<std::uint64_t> failed_{0};
  std::thread thread_;
};

[[nodiscard]] std::unique_ptr<INotifier> create_notifier(const config::AlertsConfig &config,
                                                         std::shared_ptr<net::HttpClient> http);

} // namespace sato::alerts
