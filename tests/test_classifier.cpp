#include "test_framework.hpp"

#include "sato/status/classifier.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

using sato::status::ServiceState;

sato::probe::ProbeResult result_for(const std::string &id, bool success, int latency_ms = 20,
                                    int offset_secs = 0) {
  return sato::probe::ProbeResult{.service_id = id,
                                  .timestamp = sato::testing::test_epoch() +
                                               std::chrono::seconds(offset_secs),
                                  .success = success,
                                  .latency = std::chrono::milliseconds(latency_ms),
                                  .error = success ? "" : "refused"};
}

} // namespace

void register_classifier_tests(std::vector<sato::tests::TestCase> &tests) {
  using sato::tests::require;
  namespace st = sato::status;

  tests.push_back({"classifier_unknown_service_is_checking", [] {
                     st::StatusClassifier classifier(st::ClassifierConfig{});
                     require(classifier.state("nope") == ServiceState::Checking,
                             "untracked should read as checking");
                     classifier.track("web");
                     require(classifier.record("web") != nullptr, "tracked record missing");
                   }});

  tests.push_back({"classifier_fast_success_is_operational", [] {
                     st::StatusClassifier classifier(st::ClassifierConfig{});
                     auto transition = classifier.apply(result_for("web", true));
                     require(transition.has_value(), "expected transition");
                     require(transition->from == ServiceState::Checking, "from checking");
                     require(transition->to == ServiceState::Operational, "to operational");
                     require(!classifier.apply(result_for("web", true)).has_value(),
                             "steady state should not transition");
                   }});

  tests.push_back({"classifier_slow_success_is_degraded", [] {
                     st::StatusClassifier classifier(st::ClassifierConfig{});
                     (void)classifier.apply(result_for("web", true));
                     auto transition = classifier.apply(result_for("web", true, 1500));
                     require(transition.has_value() && transition->to == ServiceState::Degraded,
                             "slow check should degrade");
                     auto back = classifier.apply(result_for("web", true, 30));
                     require(back.has_value() && back->to == ServiceState::Operational,
                             "fast check should recover");
                   }});

  tests.push_back({"classifier_down_needs_consecutive_failures", [] {
                     st::StatusClassifier classifier(st::ClassifierConfig{});
                     (void)classifier.apply(result_for("db", true));
                     auto first = classifier.apply(result_for("db", false));
                     require(first.has_value() && first->to == ServiceState::Degraded,
                             "first failure should degrade");
                     auto second = classifier.apply(result_for("db", false));
                     require(second.has_value() && second->to == ServiceState::Down,
                             "second failure should be down");
                     require(classifier.record("db")->consecutive_failures == 2,
                             "failure counter");
                     require(!classifier.apply(result_for("db", false)).has_value(),
                             "down stays down");
                   }});

  tests.push_back({"classifier_success_resets_failure_counter", [] {
                     st::StatusClassifier classifier(st::ClassifierConfig{});
                     (void)classifier.apply(result_for("db", false));
                     (void)classifier.apply(result_for("db", true));
                     (void)classifier.apply(result_for("db", false));
                     require(classifier.state("db") == ServiceState::Degraded,
                             "interleaved failures must not reach down");
                   }});

  tests.push_back({"classifier_recovery_threshold_from_down", [] {
                     st::StatusClassifier classifier(st::ClassifierConfig{
                         .down_after_failures = 1,
                         .degraded_recovery_successes = 1,
                         .down_recovery_successes = 2,
                         .degraded_latency = std::chrono::milliseconds(1000),
                         .latency_history = 100});
                     (void)classifier.apply(result_for("db", false));
                     require(classifier.state("db") == ServiceState::Down, "single failure down");
                     require(!classifier.apply(result_for("db", true)).has_value(),
                             "one success is not enough");
                     auto up = classifier.apply(result_for("db", true));
                     require(up.has_value() && up->to == ServiceState::Operational,
                             "second success recovers");
                   }});

  tests.push_back({"classifier_slow_success_from_down_is_degraded", [] {
                     st::StatusClassifier classifier(st::ClassifierConfig{});
                     (void)classifier.apply(result_for("db", false));
                     (void)classifier.apply(result_for("db", false));
                     auto slow = classifier.apply(result_for("db", true, 4000));
                     require(slow.has_value() && slow->to == ServiceState::Degraded,
                             "slow success from down should be degraded");
                   }});

  tests.push_back({"classifier_tracks_uptime_and_latency", [] {
                     st::StatusClassifier classifier(st::ClassifierConfig{
                         .down_after_failures = 2,
                         .degraded_recovery_successes = 1,
                         .down_recovery_successes = 1,
                         .degraded_latency = std::chrono::milliseconds(1000),
                         .latency_history = 3});
                     for (int latency : {10, 20, 30, 40}) {
                       (void)classifier.apply(result_for("web", true, latency));
                     }
                     (void)classifier.apply(result_for("web", false));
                     const auto *record = classifier.record("web");
                     require(record->latencies_ms.size() == 3, "latency history bounded");
                     require(record->latencies_ms.front() == 20, "oldest latency dropped");
                     require(record->uptime_percent() > 79.9 && record->uptime_percent() < 80.1,
                             "uptime should be 80%");
                     require(record->average_latency_ms() > 24.9 &&
                                 record->average_latency_ms() < 25.1,
                             "average over successes");
                   }});

  tests.push_back({"classifier_batch_preserves_order", [] {
                     st::StatusClassifier classifier(st::ClassifierConfig{});
                     auto transitions = classifier.classify(
                         {result_for("b", true), result_for("a", false), result_for("c", true)});
                     require(transitions.size() == 3, "every first result transitions");
                     require(transitions[0].service_id == "b" && transitions[1].service_id == "a",
                             "batch order kept");
                   }});

  tests.push_back({"classifier_state_strings_round_trip", [] {
                     for (const auto state : {ServiceState::Checking, ServiceState::Operational,
                                              ServiceState::Degraded, ServiceState::Down}) {
                       auto parsed = st::parse_state(st::state_to_string(state));
                       require(parsed.ok() && parsed.value() == state, "state string mismatch");
                     }
                     require(!st::parse_state("sideways").ok(), "unknown state should fail");
                   }});
}
