#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_config_tests(std::vector<sato::tests::TestCase> &tests);
void register_classifier_tests(std::vector<sato::tests::TestCase> &tests);
void register_graph_tests(std::vector<sato::tests::TestCase> &tests);
void register_governor_tests(std::vector<sato::tests::TestCase> &tests);
void register_maintenance_tests(std::vector<sato::tests::TestCase> &tests);
void register_alerts_tests(std::vector<sato::tests::TestCase> &tests);
void register_recovery_tests(std::vector<sato::tests::TestCase> &tests);
void register_state_store_tests(std::vector<sato::tests::TestCase> &tests);
void register_probe_tests(std::vector<sato::tests::TestCase> &tests);
void register_monitor_tests(std::vector<sato::tests::TestCase> &tests);
void register_daemon_tests(std::vector<sato::tests::TestCase> &tests);
void register_observability_health_tests(std::vector<sato::tests::TestCase> &tests);
void register_cli_tests(std::vector<sato::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<sato::tests::TestCase> tests;
  register_config_tests(tests);
  register_classifier_tests(tests);
  register_graph_tests(tests);
  register_governor_tests(tests);
  register_maintenance_tests(tests);
  register_alerts_tests(tests);
  register_recovery_tests(tests);
  register_state_store_tests(tests);
  register_probe_tests(tests);
  register_monitor_tests(tests);
  register_daemon_tests(tests);
  register_observability_health_tests(tests);
  register_cli_tests(tests);

  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";

  return failed == 0 ? 0 : 1;
}
