#include "test_framework.hpp"

#include "klm/diagnostics/boot_log.hpp"
#include "klm/diagnostics/crash_trace.hpp"
#include "klm/observability/boot_log_observer.hpp"
#include "klm/observability/factory.hpp"
#include "klm/observability/global.hpp"
#include "klm/observability/multi_observer.hpp"
#include "klm/observability/noop_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <ctime>

namespace {

class CountingObserver final : public klm::observability::IObserver {
public:
  explicit CountingObserver(int &counter) : counter_(counter) {}

  void record_event(const klm::observability::ObserverEvent &) override { ++counter_; }
  [[nodiscard]] std::string_view name() const override { return "counting"; }

private:
  int &counter_;
};

std::size_t count_lines(const std::string &text) {
  std::size_t lines = 0;
  for (const char ch : text) {
    if (ch == '\n') {
      ++lines;
    }
  }
  return lines;
}

} // namespace

void register_diagnostics_observability_tests(std::vector<klm::tests::TestCase> &tests) {
  using klm::tests::require;
  namespace dg = klm::diagnostics;
  namespace ob = klm::observability;
  namespace kt = klm::testing;

  tests.push_back({"boot_log_line_format_uses_local_time", [] {
                     std::tm local{};
                     local.tm_year = 2024 - 1900;
                     local.tm_mon = 2;
                     local.tm_mday = 9;
                     local.tm_hour = 7;
                     local.tm_min = 5;
                     local.tm_sec = 3;
                     local.tm_isdst = -1;
                     const auto when = std::chrono::system_clock::from_time_t(std::mktime(&local));
                     const auto line = dg::BootLog::format_line(when, "hello");
                     require(line == "[2024-03-09 07:05:03] hello", "unexpected line: " + line);
                   }});

  tests.push_back({"boot_log_appends_one_line_per_call", [] {
                     const kt::TempDir dir;
                     const dg::BootLog log(dir.path() / "nested" / "boot.log");
                     log.append("=== plugin start ===");
                     log.append("pid=42");
                     const auto content = kt::read_file(log.path());
                     require(count_lines(content) == 2, "expected two lines");
                     require(content.find("] === plugin start ===\n") != std::string::npos,
                             "start marker missing");
                     require(content.find("] pid=42\n") != std::string::npos, "pid line missing");
                   }});

  tests.push_back({"boot_log_swallows_unwritable_destination", [] {
                     const kt::TempDir dir;
                     const auto blocker = dir.create_file("blocker", "x");
                     const dg::BootLog log(blocker / "boot.log");
                     log.append("ignored");
                     require(!std::filesystem::exists(blocker / "boot.log"),
                             "nothing should be written");
                   }});

  tests.push_back({"crash_trace_opens_fault_log_in_cache_dir", [] {
#ifndef _WIN32
                     const kt::TempDir dir;
                     const auto installed = dg::install_crash_trace(dir.path());
                     require(installed.has_value(), "crash trace not installed");
                     require(*installed == dir.path() / "ipc_plugin_faults.log",
                             "unexpected fault log path");
                     require(std::filesystem::exists(*installed), "fault log not opened");
#endif
                   }});

  tests.push_back({"observer_factory_respects_backend_list", [] {
                     klm::config::Config config;
                     config.log.backend = "none";
                     auto none = ob::create_observer(config);
                     require(none->name() == "noop", "none should give noop");

                     config.log.backend = "log";
                     auto log = ob::create_observer(config);
                     require(log->name() == "multi", "log backend should be wrapped");

                     const kt::TempDir dir;
                     config.log.backend = "none";
                     auto boot_only = ob::create_observer(
                         config, dg::BootLog(dir.path() / "boot.log"));
                     require(boot_only->name() == "multi", "boot log sink should be added");
                     boot_only->record_event(ob::BootPhaseEvent{.message = "phase one"});
                     require(kt::read_file(dir.path() / "boot.log").find("phase one") !=
                                 std::string::npos,
                             "event not mirrored into boot log");
                   }});

  tests.push_back({"multi_observer_fans_out", [] {
                     int first = 0;
                     int second = 0;
                     ob::MultiObserver multi;
                     multi.add(std::make_unique<CountingObserver>(first));
                     multi.add(std::make_unique<CountingObserver>(second));
                     multi.add(std::make_unique<ob::NoopObserver>());
                     multi.record_event(ob::ErrorEvent{.component = "x", .message = "y"});
                     require(multi.size() == 3, "size mismatch");
                     require(first == 1 && second == 1, "fan-out failed");
                   }});

  tests.push_back({"describe_event_renders_each_kind", [] {
                     require(ob::describe_event(ob::BootPhaseEvent{.message = "hi"}) == "hi",
                             "boot phase");
                     require(ob::describe_event(ob::InstanceEvent{.state = "lock_held",
                                                                  .pid = 7}) ==
                                 "instance state=lock_held pid=7",
                             "instance");
                     require(ob::describe_event(ob::ResolutionEvent{.source = "none", .path = ""}) ==
                                 "repo_path=<none> source=none",
                             "resolution");
                     require(ob::describe_event(ob::ErrorEvent{.component = "ipc",
                                                               .message = "down"}) ==
                                 "error ipc: down",
                             "error");
                   }});

  tests.push_back({"global_observer_receives_record_calls", [] {
                     int count = 0;
                     ob::set_global_observer(std::make_unique<CountingObserver>(count));
                     ob::record_boot("a");
                     ob::record_instance("lock_held");
                     ob::record_resolution("configured", "/x");
                     ob::record_error("c", "m");
                     ob::set_global_observer(std::make_unique<ob::NoopObserver>());
                     require(count == 4, "expected four events");
                   }});
}
