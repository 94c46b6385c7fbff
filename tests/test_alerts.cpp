#include "test_framework.hpp"

#include "sato/alerts/aggregator.hpp"
#include "sato/alerts/notifier.hpp"
#include "sato/health/health.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <sstream>

namespace {

using sato::status::ServiceState;

sato::status::Transition down(const std::string &id, std::optional<std::string> cause = {}) {
  return sato::status::Transition{.service_id = id,
                                  .from = ServiceState::Operational,
                                  .to = ServiceState::Down,
                                  .at = sato::testing::test_epoch(),
                                  .caused_by = std::move(cause)};
}

sato::alerts::Notification sample_notification() {
  sato::alerts::AlertGroup group;
  group.id = "abc123def456";
  group.root = "db";
  group.members = {"api", "web"};
  group.first_seen = sato::testing::test_epoch();
  group.last_seen = group.first_seen;
  return sato::alerts::Notification{.kind = sato::alerts::NotificationKind::GroupOpened,
                                    .group = group,
                                    .service_id = "db",
                                    .old_status = "operational",
                                    .new_status = "down",
                                    .response_time_ms = 0,
                                    .message = "db failure affects 2 dependent service(s)",
                                    .at = sato::testing::test_epoch()};
}

} // namespace

void register_alerts_tests(std::vector<sato::tests::TestCase> &tests) {
  using sato::tests::require;
  namespace al = sato::alerts;
  namespace mt = sato::maintenance;
  namespace st = sato::testing;

  tests.push_back({"alerts_group_id_is_short_hex_and_unique", [] {
                     const auto t0 = st::test_epoch();
                     const auto a = al::make_group_id("db", t0, 1);
                     const auto b = al::make_group_id("db", t0, 2);
                     require(a.size() == 12, "group id should be 12 characters");
                     require(a.find_first_not_of("0123456789abcdef") == std::string::npos,
                             "group id should be lowercase hex");
                     require(a != b, "sequence must change the id");
                     require(a == al::make_group_id("db", t0, 1), "ids are deterministic");
                   }});

  tests.push_back({"alerts_cascade_merges_into_root_group", [] {
                     st::RecordingNotifier notifier;
                     mt::WindowManager maintenance;
                     al::AlertAggregator aggregator(notifier, maintenance);
                     const auto opened = aggregator.process(
                         {down("web", "db"), down("api", "db"), down("db")}, st::test_epoch());
                     require(opened.size() == 1, "one group for the cascade");
                     require(aggregator.open_groups().size() == 1, "one open group");
                     const auto &group = aggregator.open_groups().front();
                     require(group.root == "db", "root is db");
                     require(group.members == std::set<std::string>({"api", "web"}),
                             "dependents merged");
                     const auto sent = notifier.sent();
                     require(sent.size() == 1, "exactly one notification");
                     require(sent[0].group.members.size() == 2, "payload carries members");
                   }});

  tests.push_back({"alerts_late_dependent_joins_open_group", [] {
                     st::RecordingNotifier notifier;
                     mt::WindowManager maintenance;
                     al::AlertAggregator aggregator(notifier, maintenance);
                     (void)aggregator.process({down("db")}, st::test_epoch());
                     const auto opened = aggregator.process(
                         {down("api", "db")}, st::test_epoch() + std::chrono::seconds(20));
                     require(opened.empty(), "no new group");
                     require(aggregator.group_for("api") != nullptr, "api joined db group");
                     require(notifier.sent().size() == 1, "no second notification");
                   }});

  tests.push_back({"alerts_suppressed_during_maintenance", [] {
                     st::RecordingNotifier notifier;
                     mt::WindowManager maintenance;
                     maintenance.set_manual(mt::MaintenanceScope::everything(), true,
                                            st::test_epoch());
                     al::AlertAggregator aggregator(notifier, maintenance);
                     (void)aggregator.process({down("db")}, st::test_epoch());
                     require(aggregator.open_groups().empty(), "no group during maintenance");
                     require(notifier.sent().empty(), "nothing sent");
                     require(aggregator.notifications_suppressed() == 1, "suppression counted");
                   }});

  tests.push_back({"alerts_root_maintenance_covers_dependents", [] {
                     st::RecordingNotifier notifier;
                     mt::WindowManager maintenance;
                     maintenance.set_manual(mt::MaintenanceScope::of({"db"}), true,
                                            st::test_epoch());
                     al::AlertAggregator aggregator(notifier, maintenance);
                     (void)aggregator.process({down("api", "db")}, st::test_epoch());
                     require(notifier.sent().empty(), "dependent of a root in maintenance");
                   }});

  tests.push_back({"alerts_acknowledged_group_suppresses_escalation", [] {
                     st::RecordingNotifier notifier;
                     mt::WindowManager maintenance;
                     al::AlertAggregator aggregator(notifier, maintenance);
                     const auto ids = aggregator.process({down("db")}, st::test_epoch());
                     require(aggregator.acknowledge(ids[0], "alice", st::test_epoch()).ok(),
                             "ack should succeed");
                     require(aggregator.acknowledge(ids[0], "bob", st::test_epoch()).ok(),
                             "ack is idempotent");
                     require(aggregator.find(ids[0])->ack_actor == "alice",
                             "first actor is kept");
                     aggregator.escalate("db", st::test_epoch());
                     require(notifier.count(al::NotificationKind::GroupEscalated) == 0,
                             "escalation suppressed by ack");
                     aggregator.rate_limited("db", st::test_epoch());
                     require(notifier.count(al::NotificationKind::RateLimited) == 1,
                             "rate limit alerts ignore ack");
                   }});

  tests.push_back({"alerts_escalation_notifies_once", [] {
                     st::RecordingNotifier notifier;
                     mt::WindowManager maintenance;
                     al::AlertAggregator aggregator(notifier, maintenance);
                     aggregator.escalate("db", st::test_epoch());
                     aggregator.escalate("db", st::test_epoch());
                     require(notifier.count(al::NotificationKind::GroupEscalated) == 1,
                             "escalation is sent once");
                     require(aggregator.group_for("db")->escalated, "group flagged");
                   }});

  tests.push_back({"alerts_close_resolved_archives_group", [] {
                     st::RecordingNotifier notifier;
                     mt::WindowManager maintenance;
                     al::AlertAggregator aggregator(notifier, maintenance);
                     const auto ids =
                         aggregator.process({down("db"), down("api", "db")}, st::test_epoch());
                     std::map<std::string, ServiceState> states = {
                         {"db", ServiceState::Operational}, {"api", ServiceState::Down}};
                     const auto lookup = [&states](const std::string &id) { return states[id]; };
                     require(aggregator.close_resolved(lookup, st::test_epoch()).empty(),
                             "member still down");
                     states["api"] = ServiceState::Operational;
                     const auto closed = aggregator.close_resolved(lookup, st::test_epoch());
                     require(closed == ids, "group closes once everything is up");
                     require(aggregator.open_groups().empty(), "no open groups");
                     require(aggregator.archived().size() == 1, "archived");
                     auto late_ack = aggregator.acknowledge(ids[0], "alice", st::test_epoch());
                     require(!late_ack.ok(), "closed groups cannot be acked");
                     require(!aggregator.acknowledge("nope", "alice", st::test_epoch()).ok(),
                             "unknown group");
                   }});

  tests.push_back({"alerts_generic_payload_fields", [] {
                     const auto payload =
                         al::build_webhook_payload(sample_notification(), al::WebhookFormat::Generic);
                     require(sato::testing::json_get_string(payload, "kind") == "group_opened",
                             "kind field");
                     require(sato::testing::json_get_string(payload, "server_name") == "db",
                             "server_name field");
                     require(sato::testing::json_get_string(payload, "new_status") == "down",
                             "new_status field");
                     require(sato::testing::json_get_scalar(payload, "timestamp") == "1704067200",
                             "unix timestamp");
                     require(payload.find("\"members\":[\"api\",\"web\"]") != std::string::npos,
                             "members array");
                   }});

  tests.push_back({"alerts_slack_and_discord_payloads", [] {
                     const auto slack =
                         al::build_webhook_payload(sample_notification(), al::WebhookFormat::Slack);
                     require(slack.find("\"attachments\"") != std::string::npos, "slack shape");
                     require(slack.find("\"danger\"") != std::string::npos, "slack color");
                     require(slack.find("Server Status Change: db") != std::string::npos,
                             "slack title");
                     const auto discord = al::build_webhook_payload(sample_notification(),
                                                                    al::WebhookFormat::Discord);
                     require(discord.find("\"embeds\"") != std::string::npos, "discord shape");
                     require(discord.find("\"color\":16711680") != std::string::npos,
                             "discord red");
                   }});

  tests.push_back({"alerts_signature_matches_hmac_sha256", [] {
                     const auto signature =
                         al::sign_payload("Jefe", "what do ya want for nothing?");
                     require(signature ==
                                 "sha256=5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843",
                             "unexpected signature " + signature);
                   }});

  tests.push_back({"alerts_webhook_posts_signed_payload", [] {
                     sato::health::clear();
                     auto http = std::make_shared<st::FakeHttpClient>();
                     al::WebhookNotifier notifier(
                         al::WebhookOptions{.url = "https://hooks.example.com/x",
                                            .format = al::WebhookFormat::Generic,
                                            .secret = "s3cret",
                                            .timeout_ms = 1000,
                                            .max_queue = 8},
                         http);
                     require(notifier.notify(sample_notification()).ok(), "enqueue");
                     require(notifier.flush(std::chrono::seconds(5)), "flush in time");
                     const auto requests = http->requests();
                     require(requests.size() == 1, "one POST");
                     require(requests[0].url == "https://hooks.example.com/x", "url");
                     const auto it = requests[0].headers.find("X-Sato-Signature");
                     require(it != requests[0].headers.end(), "signature header");
                     require(it->second == al::sign_payload("s3cret", requests[0].body),
                             "signature covers body");
                     require(notifier.delivered() == 1, "delivered count");
                     require(sato::health::get_component("notifier")->status == "ok",
                             "notifier health ok");
                   }});

  tests.push_back({"alerts_webhook_failure_marks_health", [] {
                     sato::health::clear();
                     auto http = std::make_shared<st::FakeHttpClient>();
                     http->set_response(sato::net::HttpResponse{.status = 500,
                                                                .body = "",
                                                                .headers = {},
                                                                .timeout = false,
                                                                .network_error = false,
                                                                .network_error_message = ""});
                     al::WebhookNotifier notifier(
                         al::WebhookOptions{.url = "https://hooks.example.com/x",
                                            .format = al::WebhookFormat::Slack,
                                            .secret = "",
                                            .timeout_ms = 1000,
                                            .max_queue = 8},
                         http);
                     require(notifier.notify(sample_notification()).ok(), "enqueue");
                     require(notifier.flush(std::chrono::seconds(5)), "flush in time");
                     require(notifier.failed() == 1, "failure counted");
                     require(http->requests()[0].headers.empty(), "no signature without secret");
                     require(sato::health::get_component("notifier")->status == "error",
                             "notifier health error");
                     notifier.stop();
                     require(!notifier.notify(sample_notification()).ok(),
                             "stopped notifier refuses work");
                   }});

  tests.push_back({"alerts_log_notifier_line", [] {
                     std::ostringstream out;
                     al::LogNotifier notifier(&out);
                     require(notifier.notify(sample_notification()).ok(), "log notify");
                     const auto line = out.str();
                     require(line.find("[ALERT] group_opened") != std::string::npos, "kind");
                     require(line.find("members=api,web") != std::string::npos, "members");
                     require(line.find("status=operational->down") != std::string::npos,
                             "status");
                   }});

  tests.push_back({"alerts_create_notifier_combines_outputs", [] {
                     sato::config::AlertsConfig config;
                     config.log_notifications = true;
                     auto single = al::create_notifier(config, nullptr);
                     require(single->name() == "log", "log only");
                     config.webhook_url = "https://hooks.example.com/x";
                     auto both = al::create_notifier(config, std::make_shared<st::FakeHttpClient>());
                     require(both->name() == "multi", "log plus webhook");
                     require(!al::parse_webhook_format("teams").ok(), "unknown format");
                   }});
}
