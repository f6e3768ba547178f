#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "log.hpp"
#include "monitor_snapshot.hpp"
#include "probes.hpp"

class SettingsManager;

// Polls the farm on a fixed interval and publishes one MonitorSnapshot per
// cycle. The monitor only observes: it never signals the transfer processes
// it tracks.
class ArchiveMonitor {
public:
  struct Options {
    // Null members get the command-backed defaults.
    std::shared_ptr<ProcessProbe> process_probe;
    std::shared_ptr<FilesystemProbe> filesystem_probe;
    Clock clock;
  };

  using SnapshotListener = std::function<void(const std::shared_ptr<const MonitorSnapshot>&)>;
  using SnapshotListenerHandle = std::size_t;

  ArchiveMonitor(std::shared_ptr<SettingsManager> settings, Options options);
  ~ArchiveMonitor();

  ArchiveMonitor(const ArchiveMonitor&) = delete;
  ArchiveMonitor& operator=(const ArchiveMonitor&) = delete;

  // Reads settings; throws std::runtime_error on an invalid configuration.
  void start();
  // Polls on the calling thread until stop() or a fatal probe error, which
  // is rethrown here.
  void run();
  void start_background();
  void stop();

  // Runs one cycle synchronously and publishes its snapshot. ProbeError
  // propagates to the caller with the previous snapshot left in place.
  std::shared_ptr<const MonitorSnapshot> poll_once();

  std::shared_ptr<const MonitorSnapshot> snapshot() const;

  // Set once the background loop stopped on a fatal error.
  std::exception_ptr fatal_error() const;

  SnapshotListenerHandle add_snapshot_listener(SnapshotListener listener);
  void remove_snapshot_listener(SnapshotListenerHandle handle);

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  struct Config {
    std::string farm_root;
    std::string transfer_tool;
    std::chrono::seconds poll_interval{20};
    std::chrono::seconds ps_timeout{20};
    std::chrono::seconds find_timeout{40};
    double bandwidth_correction = rate_estimator::kDefaultBandwidthCorrection;
    job_registry::ReconcileOptions reconcile;
  };

  Config read_config() const;
  void schedule_poll(std::chrono::steady_clock::duration delay);
  void publish(std::shared_ptr<const MonitorSnapshot> next);

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  Config config_;

  asio::io_context io_;
  std::thread io_thread_;
  std::unique_ptr<asio::steady_timer> poll_timer_;
  std::atomic<bool> started_{false};

  std::shared_ptr<const MonitorSnapshot> snapshot_;

  mutable std::mutex state_mutex_;
  std::exception_ptr fatal_error_;
  std::unordered_map<SnapshotListenerHandle, SnapshotListener> listeners_;
  SnapshotListenerHandle next_listener_id_ = 1;
};
