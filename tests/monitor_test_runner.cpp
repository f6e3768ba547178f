#include "archive_monitor.hpp"
#include "command_line_parser.hpp"
#include "monitor_snapshot.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace std::chrono_literals;

const std::string kRoot = "/srv/farm";

struct Fixture {
  std::shared_ptr<SettingsManager> settings = std::make_shared<SettingsManager>();
  std::shared_ptr<archwatch::test::ScriptedProcessProbe> processes =
    std::make_shared<archwatch::test::ScriptedProcessProbe>();
  std::shared_ptr<archwatch::test::ScriptedFilesystemProbe> markers =
    std::make_shared<archwatch::test::ScriptedFilesystemProbe>();
  archwatch::test::ManualClock clock{1000.0};

  Fixture() {
    configure("farm_root", kRoot);
  }

  void configure(const std::string& key, const nlohmann::json& value) {
    std::string error;
    if(!settings->set_from_json(key, value, error)) {
      throw std::runtime_error("Failed to set setting " + key + ": " + error);
    }
  }

  ArchiveMonitor::Options options() const {
    ArchiveMonitor::Options opt;
    opt.process_probe = processes;
    opt.filesystem_probe = markers;
    opt.clock = clock.clock();
    return opt;
  }
};

MarkerFileEntry marker(const std::string& disk, const std::string& plot_id,
                       const std::string& job_id, uint64_t size, int k = 32) {
  return MarkerFileEntry{size, kRoot + "/" + disk + "/.plot-k" + std::to_string(k) +
                               "-2021-05-14-09-30-" + plot_id +
                               ".plot." + job_id};
}

ProcessCandidate transfer(const std::string& plot_id, Timestamp started_at, int k = 32) {
  ProcessCandidate candidate;
  candidate.tokens = {"rsync", "--bwlimit=1000000", "--preallocate", "--remove-source-files",
                      "--skip-compress=plot", "--whole-file", "--inplace",
                      "/mnt/disk1/plot-k" + std::to_string(k) + "-2021-05-14-09-30-" + plot_id + ".plot",
                      "rsync://farmer@nas1:12000/plots/004/"};
  candidate.started_at = started_at;
  return candidate;
}

bool test_poll_once_builds_snapshot() {
  Fixture fx;
  fx.configure("transfer_tool", "rsync");
  fx.processes->push({transfer("abc123def", 900.0)});
  fx.markers->push({marker("004", "abc123def", "j1", 4096), marker("002", "zzz", "j2", 10)});

  ArchiveMonitor monitor(fx.settings, fx.options());
  auto snapshot = monitor.poll_once();
  return snapshot == monitor.snapshot() &&
         snapshot->cycle == 1 &&
         !snapshot->ingress_stale && !snapshot->egress_stale &&
         fx.processes->last_tool == "rsync" &&
         fx.markers->last_root == kRoot &&
         snapshot->taken_at == 1000.0 &&
         snapshot->egress.size() == 1 &&
         snapshot->egress[0].destination_tag == "/004@nas1" &&
         snapshot->ingress.size() == 2 &&
         snapshot->ingress[0].job_id == "j2" && !snapshot->ingress[0].is_local &&
         snapshot->ingress[1].job_id == "j1" && snapshot->ingress[1].is_local &&
         snapshot->ingress[1].observed_at == 1000.0;
}

bool test_rate_across_cycles() {
  Fixture fx;
  ArchiveMonitor monitor(fx.settings, fx.options());

  fx.clock.set(0.0);
  fx.markers->push({marker("001", "xyzplot", "xyz", 1000000)});
  monitor.poll_once();

  fx.clock.set(10.0);
  fx.markers->push({marker("001", "xyzplot", "xyz", 3000000)});
  auto snapshot = monitor.poll_once();

  const auto& job = snapshot->ingress.at(0);
  auto bytes_per_sec = rate_estimator::rate(job);
  auto seconds = rate_estimator::eta(job);
  return snapshot->cycle == 2 &&
         job.sample_history.size() == 1 &&
         bytes_per_sec && std::fabs(*bytes_per_sec - 200000.0) < 1e-6 &&
         seconds && *seconds == 531809;
}

bool test_vanished_job_is_dropped() {
  Fixture fx;
  ArchiveMonitor monitor(fx.settings, fx.options());
  fx.markers->push({marker("001", "a", "j1", 10), marker("001", "b", "j2", 10)});
  monitor.poll_once();
  fx.markers->push({marker("001", "b", "j2", 20)});
  auto snapshot = monitor.poll_once();
  return snapshot->ingress.size() == 1 && snapshot->ingress[0].job_id == "j2";
}

bool test_timeout_keeps_previous_jobs() {
  Fixture fx;
  ArchiveMonitor monitor(fx.settings, fx.options());
  archwatch::test::LogCapture capture;
  capture.attach(monitor);

  fx.clock.set(0.0);
  fx.processes->push({transfer("abc", 0.0)});
  fx.markers->push({marker("001", "abc", "j1", 100)});
  monitor.poll_once();

  fx.clock.set(10.0);
  fx.processes->push_timeout();
  fx.markers->push_timeout();
  auto degraded = monitor.poll_once();

  fx.clock.set(20.0);
  fx.markers->push({marker("001", "abc", "j1", 500)});
  auto recovered = monitor.poll_once();

  auto bytes_per_sec = rate_estimator::rate(recovered->ingress.at(0));
  return degraded->ingress_stale && degraded->egress_stale &&
         degraded->ingress.size() == 1 && degraded->ingress[0].transferred_bytes == 100 &&
         degraded->egress.size() == 1 &&
         capture.contains("(stale)") &&
         !recovered->ingress_stale && !recovered->egress_stale &&
         recovered->egress.empty() &&
         !recovered->ingress[0].is_local &&
         bytes_per_sec && std::fabs(*bytes_per_sec - 20.0) < 1e-9;
}

bool test_probe_error_propagates() {
  Fixture fx;
  ArchiveMonitor monitor(fx.settings, fx.options());
  fx.markers->push({marker("001", "abc", "j1", 100)});
  auto first = monitor.poll_once();

  fx.markers->fail_next("marker listing failed");
  try {
    monitor.poll_once();
  } catch(const ProbeError& e) {
    return monitor.snapshot() == first &&
           std::string(e.what()) == "marker listing failed";
  }
  return false;
}

bool test_invalid_config_rejected() {
  auto expect_rejected = [](const std::string& key, const nlohmann::json& value) {
    Fixture fx;
    fx.configure(key, value);
    ArchiveMonitor monitor(fx.settings, fx.options());
    try {
      monitor.start();
    } catch(const std::runtime_error&) {
      return true;
    }
    return false;
  };
  return expect_rejected("farm_root", "") &&
         expect_rejected("poll_interval", 0) &&
         expect_rejected("find_timeout", -5) &&
         expect_rejected("bwlimit_correction", 0.0) &&
         expect_rejected("max_history_samples", -1);
}

bool test_background_loop_publishes() {
  Fixture fx;
  fx.configure("poll_interval", 1);
  ArchiveMonitor monitor(fx.settings, fx.options());
  archwatch::test::LogCapture capture;
  capture.attach(monitor);

  std::atomic<uint64_t> last_cycle{0};
  auto handle = monitor.add_snapshot_listener([&](const std::shared_ptr<const MonitorSnapshot>& snapshot){
    last_cycle = snapshot->cycle;
  });

  monitor.start_background();
  bool ok = archwatch::test::wait_for_condition([&]{ return last_cycle >= 2; }, 5s);
  monitor.stop();
  monitor.remove_snapshot_listener(handle);

  const auto seen = last_cycle.load();
  monitor.poll_once();
  return ok &&
         capture.contains("Cycle 1:") &&
         last_cycle.load() == seen &&
         !monitor.fatal_error();
}

bool test_fatal_error_ends_run() {
  Fixture fx;
  ArchiveMonitor monitor(fx.settings, fx.options());
  archwatch::test::LogCapture capture;
  capture.attach(monitor);
  fx.markers->fail_next("find: permission denied");

  monitor.start();
  try {
    monitor.run();
  } catch(const ProbeError&) {
    monitor.stop();
    return monitor.fatal_error() != nullptr &&
           capture.contains("Polling stopped: find: permission denied");
  }
  return false;
}

bool test_listener_exception_is_logged() {
  Fixture fx;
  ArchiveMonitor monitor(fx.settings, fx.options());
  archwatch::test::LogCapture capture;
  capture.attach(monitor);
  int calls = 0;
  monitor.add_snapshot_listener([](const std::shared_ptr<const MonitorSnapshot>&){
    throw std::runtime_error("listener broke");
  });
  monitor.add_snapshot_listener([&](const std::shared_ptr<const MonitorSnapshot>&){
    ++calls;
  });
  auto snapshot = monitor.poll_once();
  return snapshot->cycle == 1 && calls == 1 && capture.contains("listener broke");
}

bool test_snapshot_json_file() {
  Fixture fx;
  auto workspace = archwatch::test::prepare_workspace("archwatch_monitor_runner");
  auto path = workspace / "snapshot.json";

  ArchiveMonitor monitor(fx.settings, fx.options());
  fx.processes->push({transfer("abc", 900.0)});
  fx.markers->push({marker("004", "abc", "j1", 4096)});
  auto snapshot = monitor.poll_once();

  std::string error;
  bool written = snapshot_json::write_file(*snapshot, path, error);

  nlohmann::json doc;
  {
    std::ifstream in(path);
    if(in) in >> doc;
  }
  std::error_code ec;
  const bool temp_left = std::filesystem::exists(workspace / "snapshot.json.tmp");
  std::filesystem::remove_all(workspace, ec);

  if(!written || temp_left || !doc.is_object()) return false;
  const auto& ingress = doc.at("ingress").at(0);
  const auto& egress = doc.at("egress").at(0);
  const double expected_progress = 100.0 * 1000000.0 * 0.8 / 106364865085.0;
  return doc.at("cycle").get<uint64_t>() == 1 &&
         doc.at("ingress_stale").get<bool>() == false &&
         ingress.at("job_id").get<std::string>() == "j1" &&
         ingress.at("transferred_bytes").get<uint64_t>() == 4096 &&
         ingress.at("expected_bytes").get<uint64_t>() == 106364865085ULL &&
         ingress.at("rate").is_null() &&
         ingress.at("eta").is_null() &&
         ingress.at("is_local").get<bool>() &&
         egress.at("destination_tag").get<std::string>() == "/004@nas1" &&
         egress.at("bandwidth_limit").get<uint64_t>() == 1000000 &&
         std::fabs(egress.at("progress").get<double>() - expected_progress) < 1e-12;
}

bool test_unknown_size_class_serializes_null() {
  Fixture fx;
  ArchiveMonitor monitor(fx.settings, fx.options());

  fx.clock.set(0.0);
  fx.processes->push({transfer("small", 0.0, 20)});
  fx.markers->push({marker("003", "small", "j20", 1000, 20)});
  monitor.poll_once();

  fx.clock.set(10.0);
  fx.processes->push({transfer("small", 0.0, 20)});
  fx.markers->push({marker("003", "small", "j20", 5000, 20)});
  auto snapshot = monitor.poll_once();

  auto doc = snapshot_json::to_json(*snapshot);
  const auto& ingress = doc.at("ingress").at(0);
  const auto& egress = doc.at("egress").at(0);
  return snapshot->ingress.at(0).plot_k == 20 &&
         snapshot->egress.at(0).plot_k == 20 &&
         ingress.at("expected_bytes").is_null() &&
         ingress.at("progress").is_null() &&
         std::fabs(ingress.at("rate").get<double>() - 400.0) < 1e-9 &&
         ingress.at("eta").is_null() &&
         ingress.at("is_local").get<bool>() &&
         egress.at("progress").is_null() &&
         egress.at("eta").is_null();
}

bool test_only_parsed_transfers_mark_local() {
  Fixture fx;
  ArchiveMonitor monitor(fx.settings, fx.options());

  ProcessCandidate helper;
  helper.tokens = {"rsync", "--server", "/mnt/disk1/plot-k32-2021-05-14-09-30-abc.plot"};
  helper.started_at = 900.0;
  fx.processes->push({helper});
  fx.markers->push({marker("001", "abc", "j1", 100)});
  auto snapshot = monitor.poll_once();

  return snapshot->egress.empty() &&
         snapshot->ingress.size() == 1 &&
         !snapshot->ingress[0].is_local;
}

bool test_unwritable_snapshot_path() {
  MonitorSnapshot snapshot;
  std::string error;
  bool written = snapshot_json::write_file(snapshot, "/nonexistent-archwatch-dir/snapshot.json", error);
  return !written && !error.empty();
}

bool test_command_line_overrides() {
  SettingsManager settings;
  CommandLineParser parser;
  std::vector<std::string> args = {"archwatch", "/data/farm", "--interval", "5", "-v",
                                   "--tool=rclone", "--correction", "0.5", "--once"};
  std::vector<char*> argv;
  for(auto& arg : args) argv.push_back(arg.data());
  std::string error;
  if(!parser.parse(static_cast<int>(argv.size()), argv.data(), settings, error)) return false;
  return settings.get<std::string>("farm_root") == "/data/farm" &&
         settings.get<int>("poll_interval") == 5 &&
         settings.get<bool>("verbose") &&
         settings.get<std::string>("transfer_tool") == "rclone" &&
         settings.get<double>("bwlimit_correction") == 0.5 &&
         settings.get<bool>("once") &&
         settings.get<int>("find_timeout") == 40;
}

bool test_command_line_errors() {
  CommandLineParser parser;
  auto rejects = [&](std::vector<std::string> args) {
    SettingsManager settings;
    std::vector<char*> argv;
    for(auto& arg : args) argv.push_back(arg.data());
    std::string error;
    return !parser.parse(static_cast<int>(argv.size()), argv.data(), settings, error) && !error.empty();
  };
  return rejects({"archwatch", "--no-such-option"}) &&
         rejects({"archwatch", "--interval"}) &&
         rejects({"archwatch", "--interval", "soon"}) &&
         rejects({"archwatch", "/a", "/b"});
}

bool test_settings_persist() {
  auto workspace = archwatch::test::prepare_workspace("archwatch_settings_runner");
  auto path = workspace / ".config" / "archwatch.json";

  SettingsManager original;
  original.set_settings_path(path);
  std::string error;
  bool ok = original.set_from_string("farm_root", "/srv/farm", error) &&
            original.set_from_string("max_history_samples", "64", error) &&
            original.set_from_string("once", "true", error) &&
            original.save();

  SettingsManager restored;
  restored.set_settings_path(path);
  ok = ok && restored.load();

  std::error_code ec;
  std::filesystem::remove_all(workspace, ec);
  return ok &&
         restored.get<std::string>("farm_root") == "/srv/farm" &&
         restored.get<int>("max_history_samples") == 64 &&
         !restored.get<bool>("once");
}

} // namespace

int main(int argc, char** argv) {
  archwatch::test::LogCapture logs;
  std::vector<archwatch::test::TestCase> tests = {
    {"poll_once_builds_snapshot", test_poll_once_builds_snapshot},
    {"rate_across_cycles", test_rate_across_cycles},
    {"vanished_job_is_dropped", test_vanished_job_is_dropped},
    {"timeout_keeps_previous_jobs", test_timeout_keeps_previous_jobs},
    {"probe_error_propagates", test_probe_error_propagates},
    {"invalid_config_rejected", test_invalid_config_rejected},
    {"background_loop_publishes", test_background_loop_publishes},
    {"fatal_error_ends_run", test_fatal_error_ends_run},
    {"listener_exception_is_logged", test_listener_exception_is_logged},
    {"snapshot_json_file", test_snapshot_json_file},
    {"unknown_size_class_serializes_null", test_unknown_size_class_serializes_null},
    {"only_parsed_transfers_mark_local", test_only_parsed_transfers_mark_local},
    {"unwritable_snapshot_path", test_unwritable_snapshot_path},
    {"command_line_overrides", test_command_line_overrides},
    {"command_line_errors", test_command_line_errors},
    {"settings_persist", test_settings_persist}
  };
  return archwatch::test::run_tests("monitor", argc, argv, logs, tests);
}
