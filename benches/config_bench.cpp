#include "bench_common.hpp"

#include "sato/config/config.hpp"
#include "sato/graph/dependency_graph.hpp"

namespace {

constexpr const char *BENCH_CONFIG = R"(
[monitor]
tick_interval_secs = 15

[services.db]
check_type = "tcp"
target = "127.0.0.1:5432"
remediation_command = "systemctl restart postgresql"

[services.api]
check_type = "http"
target = "http://127.0.0.1:8080/health"
depends_on = ["db"]

[services.web]
check_type = "http"
target = "http://127.0.0.1:80/"
depends_on = ["api"]
)";

} // namespace

void run_config_benchmark() {
  sato::bench::run_bench("config_parse", 2000, [] {
    (void)sato::config::parse_config(BENCH_CONFIG);
  });

  const auto parsed = sato::config::parse_config(BENCH_CONFIG);
  if (!parsed.ok()) {
    std::cout << "config_parse failed: " << parsed.error() << "\n";
    return;
  }
  sato::bench::run_bench("config_validate", 2000, [&] {
    (void)sato::config::validate_config(parsed.value());
  });
  sato::bench::run_bench("graph_build", 2000, [&] {
    (void)sato::graph::build_graph(parsed.value().services, parsed.value().groups);
  });
}
