#include "test_framework.hpp"

#include "sato/exec/command_runner.hpp"
#include "sato/net/tcp.hpp"
#include "sato/probe/engine.hpp"
#include "sato/probe/probe.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

sato::net::HttpResponse http_status(std::uint16_t status) {
  return sato::net::HttpResponse{.status = status,
                                 .body = "",
                                 .headers = {},
                                 .timeout = false,
                                 .network_error = false,
                                 .network_error_message = ""};
}

sato::exec::CommandResult command_output(int exit_code, std::string stdout_text) {
  return sato::exec::CommandResult{.exit_code = exit_code,
                                   .stdout_text = std::move(stdout_text),
                                   .stderr_text = "",
                                   .timed_out = false,
                                   .cancelled = false};
}

} // namespace

void register_probe_tests(std::vector<sato::tests::TestCase> &tests) {
  using sato::tests::require;
  namespace pr = sato::probe;
  namespace st = sato::testing;

  tests.push_back({"probe_engine_bounds_concurrency_and_keeps_order", [] {
                     st::ManualClock clock;
                     auto probe = std::make_shared<st::ScriptedProbe>();
                     probe->set_delay(std::chrono::milliseconds(40));
                     probe->set_healthy("s3", false);
                     pr::ProbeEngine engine(
                         pr::ProbeEngineConfig{.max_concurrent_checks = 2,
                                               .default_timeout = std::chrono::milliseconds(1000),
                                               .history_limit = 10},
                         st::registry_for(probe), clock);
                     std::vector<pr::Service> services;
                     for (int i = 0; i < 6; ++i) {
                       services.push_back(st::make_service("s" + std::to_string(i)));
                     }
                     const auto results = engine.run_batch(services);
                     require(results.size() == 6, "one result per service");
                     for (std::size_t i = 0; i < results.size(); ++i) {
                       require(results[i].service_id == services[i].id, "result order");
                     }
                     require(!results[3].success, "scripted failure");
                     require(results[3].error == "connection refused", "failure reason");
                     require(probe->max_concurrency() <= 2, "pool bound exceeded");
                     require(probe->max_concurrency() >= 1, "probes ran");
                   }});

  tests.push_back({"probe_engine_history_is_bounded", [] {
                     st::ManualClock clock;
                     auto probe = std::make_shared<st::ScriptedProbe>();
                     pr::ProbeEngine engine(
                         pr::ProbeEngineConfig{.max_concurrent_checks = 1,
                                               .default_timeout = std::chrono::milliseconds(100),
                                               .history_limit = 3},
                         st::registry_for(probe), clock);
                     const auto service = st::make_service("web");
                     for (int i = 0; i < 5; ++i) {
                       (void)engine.run_one(service);
                     }
                     require(engine.history("web").size() == 3, "history limit");
                     require(engine.history("other").empty(), "unknown service history");
                   }});

  tests.push_back({"probe_engine_missing_probe_fails_check", [] {
                     st::ManualClock clock;
                     pr::ProbeEngine engine(pr::ProbeEngineConfig{},
                                            std::make_shared<pr::ProbeRegistry>(), clock);
                     const auto result = engine.run_one(st::make_service("web"));
                     require(!result.success, "no probe registered");
                     require(result.timestamp == clock.now(), "timestamp from the clock");
                   }});

  tests.push_back({"probe_http_accepts_2xx_and_expected_codes", [] {
                     auto http = std::make_shared<st::FakeHttpClient>();
                     pr::HttpProbe probe(http);
                     auto service = st::make_service("web");
                     require(probe.check(service, std::chrono::milliseconds(100)).success,
                             "200 is healthy");
                     http->set_response(http_status(503));
                     auto down = probe.check(service, std::chrono::milliseconds(100));
                     require(!down.success && down.error == "unexpected status 503",
                             "503 is a failure");
                     service.expected_status = {503};
                     require(probe.check(service, std::chrono::milliseconds(100)).success,
                             "explicitly expected code");
                   }});

  tests.push_back({"probe_http_falls_back_to_get", [] {
                     auto http = std::make_shared<st::FakeHttpClient>();
                     http->set_response(http_status(405));
                     pr::HttpProbe probe(http);
                     (void)probe.check(st::make_service("web"), std::chrono::milliseconds(100));
                     const auto requests = http->requests();
                     require(requests.size() == 2, "HEAD then GET");
                     require(requests[0].method == "HEAD" && requests[1].method == "GET",
                             "method order");
                   }});

  tests.push_back({"probe_http_rejects_non_http_target", [] {
                     auto http = std::make_shared<st::FakeHttpClient>();
                     pr::HttpProbe probe(http);
                     auto service = st::make_service("web");
                     service.target = "ftp://example.com";
                     require(!probe.check(service, std::chrono::milliseconds(100)).success,
                             "invalid scheme");
                     require(http->requests().empty(), "no request sent");
                   }});

  tests.push_back({"probe_container_requires_every_member_running", [] {
                     auto runner = std::make_shared<st::FakeCommandRunner>();
                     pr::ContainerProbe probe(runner);
                     auto service = st::make_service("stack");
                     service.check_type = pr::CheckType::Container;
                     service.target = "web,worker";
                     runner->set_result(command_output(0, "running\nrunning\n"));
                     require(probe.check(service, std::chrono::milliseconds(100)).success,
                             "all running");
                     runner->set_result(command_output(0, "running\nexited\n"));
                     auto outcome = probe.check(service, std::chrono::milliseconds(100));
                     require(!outcome.success, "one exited");
                     require(outcome.error == "container worker is exited", "names the member");
                     const auto argv = runner->invocations().front();
                     require(argv.front() == "docker" && argv.back() == "worker", "docker argv");
                   }});

  tests.push_back({"container_check_trims_member_names", [] {
                     auto runner = std::make_shared<st::FakeCommandRunner>();
                     pr::ContainerProbe probe(runner);
                     auto service = st::make_service("stack");
                     service.check_type = pr::CheckType::Container;
                     service.target = "a, b ,,";
                     runner->set_result(command_output(0, "running\nrunning\n"));
                     require(probe.check(service, std::chrono::milliseconds(100)).success,
                             "both running");
                     const auto argv = runner->invocations().front();
                     require(argv.size() == 6, "two container names passed");
                     require(argv[4] == "a" && argv[5] == "b", "names passed without spaces");
                   }});

  tests.push_back({"probe_unit_reads_is_active", [] {
                     auto runner = std::make_shared<st::FakeCommandRunner>();
                     pr::UnitProbe probe(runner);
                     auto service = st::make_service("nginx");
                     service.target = "nginx.service";
                     runner->set_result(command_output(0, "active\n"));
                     require(probe.check(service, std::chrono::milliseconds(100)).success,
                             "active unit");
                     runner->set_result(command_output(3, "failed\n"));
                     auto outcome = probe.check(service, std::chrono::milliseconds(100));
                     require(!outcome.success && outcome.error == "unit nginx.service is failed",
                             "failed unit");
                   }});

  tests.push_back({"probe_tcp_endpoint_parsing", [] {
                     auto v4 = sato::net::parse_endpoint("127.0.0.1:5432");
                     require(v4.ok() && v4.value().host == "127.0.0.1" && v4.value().port == 5432,
                             "ipv4 endpoint");
                     auto v6 = sato::net::parse_endpoint("[::1]:8080");
                     require(v6.ok() && v6.value().host == "::1" && v6.value().port == 8080,
                             "ipv6 endpoint");
                     require(!sato::net::parse_endpoint("localhost").ok(), "missing port");
                     require(!sato::net::parse_endpoint("localhost:99999").ok(), "port range");
                   }});

  tests.push_back({"probe_tcp_connects_to_listener", [] {
                     const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
                     require(fd >= 0, "socket");
                     sockaddr_in addr{};
                     addr.sin_family = AF_INET;
                     addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
                     addr.sin_port = 0;
                     require(::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0,
                             "bind");
                     require(::listen(fd, 4) == 0, "listen");
                     socklen_t len = sizeof(addr);
                     require(::getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len) == 0,
                             "getsockname");
                     const auto port = ntohs(addr.sin_port);

                     auto status = sato::net::tcp_connect(
                         sato::net::Endpoint{.host = "127.0.0.1", .port = port},
                         std::chrono::milliseconds(1000));
                     ::close(fd);
                     require(status.ok(), status.error());

                     auto refused = sato::net::tcp_connect(
                         sato::net::Endpoint{.host = "127.0.0.1", .port = port},
                         std::chrono::milliseconds(500));
                     require(!refused.ok(), "closed listener should refuse");
                   }});

  tests.push_back({"exec_runner_captures_output_and_exit_code", [] {
                     sato::exec::ProcessRunner runner;
                     auto ok = runner.run(sato::exec::shell_argv("echo hello; exit 0"));
                     require(ok.ok(), ok.ok() ? "" : ok.error());
                     require(ok.value().stdout_text == "hello\n", "stdout captured");
                     auto failed = runner.run(sato::exec::shell_argv("echo oops >&2; exit 4"));
                     require(failed.ok(), "process started");
                     require(failed.value().exit_code == 4, "exit code");
                     require(failed.value().stderr_text == "oops\n", "stderr captured");
                     require(!failed.value().succeeded(), "non-zero exit");
                   }});

  tests.push_back({"exec_runner_times_out_and_cancels", [] {
                     sato::exec::ProcessRunner runner;
                     const auto started = std::chrono::steady_clock::now();
                     auto slow = runner.run(sato::exec::shell_argv("sleep 5"),
                                            sato::exec::CommandOptions{
                                                .timeout = std::chrono::milliseconds(200),
                                                .cancel = nullptr});
                     require(slow.ok(), "process started");
                     require(slow.value().timed_out, "timeout flagged");
                     require(std::chrono::steady_clock::now() - started < std::chrono::seconds(4),
                             "child killed promptly");

                     std::atomic<bool> cancel{true};
                     auto cancelled = runner.run(sato::exec::shell_argv("sleep 5"),
                                                 sato::exec::CommandOptions{
                                                     .timeout = std::chrono::seconds(10),
                                                     .cancel = &cancel});
                     require(cancelled.ok() && cancelled.value().cancelled, "cancel flagged");
                   }});
}
