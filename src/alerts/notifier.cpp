#include "sato/alerts/notifier.hpp"

#include "sato/common/fs.hpp"
#include "sato/common/json_util.hpp"
#include "sato/health/health.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <iomanip>
#include <iostream>
#include <sstream>

namespace sato::alerts {

namespace {

std::string members_text(const AlertGroup &group) {
  return common::join(std::vector<std::string>(group.members.begin(), group.members.end()), ",");
}

std::string title_for(const Notification &notification) {
  switch (notification.kind) {
  case NotificationKind::GroupOpened:
    return "Server Status Change: " + notification.group.root;
  case NotificationKind::GroupEscalated:
    return "Manual Intervention Required: " + notification.group.root;
  case NotificationKind::RateLimited:
    return "Restarts Rate Limited: " + notification.service_id;
  }
  return notification.group.root;
}

std::string response_time_text(const Notification &notification) {
  if (notification.response_time_ms <= 0) {
    return "N/A";
  }
  return std::to_string(notification.response_time_ms) + "ms";
}

bool healthy(const Notification &notification) {
  return notification.new_status == "operational";
}

} // namespace

LogNotifier::LogNotifier(std::ostream *out) : out_(out != nullptr ? out : &std::cerr) {}

common::Status LogNotifier::notify(const Notification &notification) {
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << common::format_rfc3339(notification.at) << " [ALERT] "
        << notification_kind_to_string(notification.kind) << " group=" << notification.group.id
        << " root=" << notification.group.root;
  if (!notification.group.members.empty()) {
    *out_ << " members=" << members_text(notification.group);
  }
  if (notification.service_id != notification.group.root) {
    *out_ << " service=" << notification.service_id;
  }
  *out_ << " status=" << notification.old_status << "->" << notification.new_status;
  if (!notification.message.empty()) {
    *out_ << " message=\"" << notification.message << "\"";
  }
  *out_ << "\n";
  out_->flush();
  return common::Status::success();
}

MultiNotifier::MultiNotifier(std::vector<std::unique_ptr<INotifier>> notifiers)
    : notifiers_(std::move(notifiers)) {}

common::Status MultiNotifier::notify(const Notification &notification) {
  common::Status first = common::Status::success();
  for (auto &notifier : notifiers_) {
    auto status = notifier->notify(notification);
    if (!status.ok() && first.ok()) {
      first = common::Status::error(std::string(notifier->name()) + ": " + status.error());
    }
  }
  return first;
}

bool MultiNotifier::flush(const std::chrono::milliseconds timeout) {
  bool drained = true;
  for (auto &notifier : notifiers_) {
    drained = notifier->flush(timeout) && drained;
  }
  return drained;
}

common::Result<WebhookFormat> parse_webhook_format(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized.empty() || normalized == "generic" || normalized == "json") {
    return common::Result<WebhookFormat>::success(WebhookFormat::Generic);
  }
  if (normalized == "slack") {
    return common::Result<WebhookFormat>::success(WebhookFormat::Slack);
  }
  if (normalized == "discord") {
    return common::Result<WebhookFormat>::success(WebhookFormat::Discord);
  }
  return common::Result<WebhookFormat>::failure("unknown webhook format: " + value);
}

std::string build_webhook_payload(const Notification &notification, const WebhookFormat format) {
  const auto &group = notification.group;
  const std::string status_line = notification.old_status + " -> " + notification.new_status;
  const std::int64_t ts_seconds = common::to_unix_millis(notification.at) / 1000;
  std::ostringstream json;

  switch (format) {
  case WebhookFormat::Slack:
    json << "{\"attachments\":[{";
    json << "\"color\":\"" << (healthy(notification) ? "good" : "danger") << "\",";
    json << "\"title\":\"" << common::json_escape(title_for(notification)) << "\",";
    json << "\"fields\":[";
    json << "{\"title\":\"Status\",\"value\":\"" << common::json_escape(status_line)
         << "\",\"short\":true},";
    json << "{\"title\":\"Response Time\",\"value\":\"" << response_time_text(notification)
         << "\",\"short\":true},";
    json << "{\"title\":\"Group\",\"value\":\"" << common::json_escape(group.id)
         << "\",\"short\":true}";
    json << "],";
    json << "\"text\":\"" << common::json_escape(notification.message) << "\",";
    json << "\"ts\":" << ts_seconds;
    json << "}]}";
    break;
  case WebhookFormat::Discord:
    json << "{\"embeds\":[{";
    json << "\"title\":\"" << common::json_escape(title_for(notification)) << "\",";
    json << "\"color\":" << (healthy(notification) ? 0x00FF00 : 0xFF0000) << ",";
    json << "\"fields\":[";
    json << "{\"name\":\"Status\",\"value\":\"" << common::json_escape(status_line)
         << "\",\"inline\":true},";
    json << "{\"name\":\"Response Time\",\"value\":\"" << response_time_text(notification)
         << "\",\"inline\":true},";
    json << "{\"name\":\"Group\",\"value\":\"" << common::json_escape(group.id)
         << "\",\"inline\":true}";
    json << "],";
    json << "\"description\":\"" << common::json_escape(notification.message) << "\",";
    json << "\"timestamp\":\"" << common::format_rfc3339(notification.at) << "\"";
    json << "}]}";
    break;
  case WebhookFormat::Generic:
    json << "{";
    json << "\"kind\":\"" << notification_kind_to_string(notification.kind) << "\",";
    json << "\"group_id\":\"" << common::json_escape(group.id) << "\",";
    json << "\"server_name\":\"" << common::json_escape(notification.service_id) << "\",";
    json << "\"root\":\"" << common::json_escape(group.root) << "\",";
    json << "\"members\":[";
    bool first = true;
    for (const auto &member : group.members) {
      if (!first) {
        json << ",";
      }
      first = false;
      json << "\"" << common::json_escape(member) << "\"";
    }
    json << "],";
    json << "\"old_status\":\"" << common::json_escape(notification.old_status) << "\",";
    json << "\"new_status\":\"" << common::json_escape(notification.new_status) << "\",";
    json << "\"response_time\":" << notification.response_time_ms << ",";
    json << "\"acknowledged\":" << (group.acknowledged ? "true" : "false") << ",";
    json << "\"escalated\":" << (group.escalated ? "true" : "false") << ",";
    json << "\"message\":\"" << common::json_escape(notification.message) << "\",";
    json << "\"timestamp\":" << ts_seconds;
    json << "}";
    break;
  }
  return json.str();
}

std::string sign_payload(const std::string &secret, const std::string &body) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  HMAC(EVP_sha256(), secret.data(), static_cast<int>(secret.size()),
       reinterpret_cast<const unsigned char *>(body.data()), body.size(), digest, &digest_len);
  std::ostringstream out;
  out << "sha256=" << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < digest_len; ++i) {
    out << std::setw(2) << static_cast<int>(digest[i]);
  }
  return out.str();
}

WebhookNotifier::WebhookNotifier(WebhookOptions options, std::shared_ptr<net::HttpClient> http)
    : options_(std::move(options)), http_(std::move(http)) {
  running_ = true;
  thread_ = std::thread([this]() { deliver_loop(); });
}

WebhookNotifier::~WebhookNotifier() { stop(); }

common::Status WebhookNotifier::notify(const Notification &notification) {
  if (!running_) {
    return common::Status::error("webhook notifier stopped");
  }
  std::string body = build_webhook_payload(notification, options_.format);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.size() >= options_.max_queue) {
      ++failed_;
      return common::Status::error("webhook queue full");
    }
    queue_.push_back(std::move(body));
  }
  cv_.notify_all();
  return common::Status::success();
}

bool WebhookNotifier::flush(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this]() { return queue_.empty() && !busy_; });
}

void WebhookNotifier::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ && !thread_.joinable()) {
      return;
    }
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void WebhookNotifier::deliver_loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    cv_.wait(lock, [this]() { return !queue_.empty() || !running_; });
    if (queue_.empty()) {
      break;
    }
    std::string body = std::move(queue_.front());
    queue_.pop_front();
    busy_ = true;
    lock.unlock();
    deliver(body);
    lock.lock();
    busy_ = false;
    cv_.notify_all();
  }
}

void WebhookNotifier::deliver(const std::string &body) {
  net::HeaderMap headers;
  if (!options_.secret.empty()) {
    headers["X-Sato-Signature"] = sign_payload(options_.secret, body);
  }
  const auto response = http_->post_json(options_.url, headers, body, options_.timeout_ms);
  if (response.timeout || response.network_error) {
    ++failed_;
    const std::string reason =
        response.timeout ? std::string("timeout") : response.network_error_message;
    health::mark_component_error("notifier", "webhook delivery failed: " + reason);
    std::cerr << "[alerts][webhook] delivery failed: " << reason << "\n";
    return;
  }
  if (response.status < 200 || response.status >= 300) {
    ++failed_;
    health::mark_component_error("notifier",
                                 "webhook returned HTTP " + std::to_string(response.status));
    std::cerr << "[alerts][webhook] delivery failed: status=" << response.status << "\n";
    return;
  }
  ++delivered_;
  health::mark_component_ok("notifier");
}

std::unique_ptr<INotifier> create_notifier(const config::AlertsConfig &config,
                                           std::shared_ptr<net::HttpClient> http) {
  std::vector<std::unique_ptr<INotifier>> notifiers;
  if (config.log_notifications) {
    notifiers.push_back(std::make_unique<LogNotifier>());
  }
  if (!config.webhook_url.empty() && http != nullptr) {
    // validate_config has already rejected unknown formats.
    const auto format = parse_webhook_format(config.webhook_format).value_or(WebhookFormat::Generic);
    notifiers.push_back(std::make_unique<WebhookNotifier>(
        WebhookOptions{.url = config.webhook_url,
                       .format = format,
                       .secret = config.webhook_secret,
                       .timeout_ms = config.webhook_timeout_ms,
                       .max_queue = 256},
        std::move(http)));
  }
  if (notifiers.size() == 1) {
    return std::move(notifiers.front());
  }
  return std::make_unique<MultiNotifier>(std::move(notifiers));
}

} // namespace sato::alerts
