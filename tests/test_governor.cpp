#include "test_framework.hpp"

#include "sato/recovery/governor.hpp"
#include "sato/recovery/timer_queue.hpp"
#include "tests/helpers/test_helpers.hpp"

void register_governor_tests(std::vector<sato::tests::TestCase> &tests) {
  using sato::tests::require;
  namespace rc = sato::recovery;
  namespace st = sato::testing;

  tests.push_back({"governor_allows_up_to_cap", [] {
                     rc::FailureRateGovernor governor(3, std::chrono::minutes(60));
                     const auto t0 = st::test_epoch();
                     for (int i = 0; i < 3; ++i) {
                       const auto now = t0 + std::chrono::minutes(i);
                       require(governor.check_at("db", now).allowed, "should allow");
                       governor.record_at("db", now);
                     }
                     auto denied = governor.check_at("db", t0 + std::chrono::minutes(5));
                     require(!denied.allowed, "fourth attempt should be denied");
                     require(denied.new_episode, "first denial starts an episode");
                     require(denied.in_window == 3, "window count");
                     auto again = governor.check_at("db", t0 + std::chrono::minutes(6));
                     require(!again.allowed && !again.new_episode,
                             "repeat denial is the same episode");
                     require(governor.suppressing("db"), "suppression flag set");
                   }});

  tests.push_back({"governor_window_slides", [] {
                     rc::FailureRateGovernor governor(2, std::chrono::minutes(60));
                     const auto t0 = st::test_epoch();
                     governor.record_at("db", t0);
                     governor.record_at("db", t0 + std::chrono::minutes(30));
                     require(!governor.check_at("db", t0 + std::chrono::minutes(59)).allowed,
                             "both stamps in window");
                     auto later = governor.check_at("db", t0 + std::chrono::minutes(61));
                     require(later.allowed, "oldest stamp aged out");
                     require(!governor.suppressing("db"), "allowed check ends the episode");
                     require(governor.count_at("db", t0 + std::chrono::minutes(91)) == 0,
                             "everything aged out");
                   }});

  tests.push_back({"governor_services_are_independent", [] {
                     rc::FailureRateGovernor governor(1, std::chrono::minutes(60));
                     const auto t0 = st::test_epoch();
                     governor.record_at("db", t0);
                     require(!governor.check_at("db", t0).allowed, "db capped");
                     require(governor.check_at("api", t0).allowed, "api unaffected");
                   }});

  tests.push_back({"governor_restore_keeps_episode", [] {
                     rc::FailureRateGovernor governor(1, std::chrono::minutes(60));
                     const auto t0 = st::test_epoch();
                     governor.restore("db", {t0}, true);
                     auto decision = governor.check_at("db", t0 + std::chrono::minutes(1));
                     require(!decision.allowed, "restored stamp counts");
                     require(!decision.new_episode, "restored episode is not new");
                   }});

  tests.push_back({"timer_queue_pops_due_in_order", [] {
                     rc::TimerQueue timers;
                     const auto t0 = st::test_epoch();
                     const auto late = timers.schedule("b", t0 + std::chrono::seconds(20));
                     const auto early = timers.schedule("a", t0 + std::chrono::seconds(10));
                     const auto cancelled = timers.schedule("c", t0 + std::chrono::seconds(5));
                     require(timers.cancel(cancelled), "cancel pending timer");
                     require(!timers.cancel(cancelled), "cancel twice fails");
                     require(timers.next_due() == t0 + std::chrono::seconds(10), "next due");
                     require(timers.pop_due(t0 + std::chrono::seconds(9)).empty(), "none due");
                     auto due = timers.pop_due(t0 + std::chrono::seconds(30));
                     require(due.size() == 2, "both due");
                     require(due[0].id == early && due[1].id == late, "earliest first");
                     require(timers.size() == 0, "queue drained");
                   }});
}
