#include "archive_monitor.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "locality_classifier.hpp"
#include "settings_manager.hpp"

namespace {

std::chrono::seconds positive_seconds(const SettingsManager& settings, const std::string& key) {
  int value = settings.get<int>(key);
  if(value <= 0) {
    throw std::runtime_error("Setting '" + key + "' must be a positive number of seconds (got " +
                             std::to_string(value) + ")");
  }
  return std::chrono::seconds(value);
}

std::string format_optional_percent(const std::optional<double>& fraction) {
  if(!fraction) return "-";
  return fmt::format("{:.1f}%", *fraction * 100.0);
}

std::string format_optional_rate(const std::optional<double>& bytes_per_sec) {
  if(!bytes_per_sec) return "-";
  return fmt::format("{:.1f} MB/s", *bytes_per_sec / 1e6);
}

} // namespace

ArchiveMonitor::ArchiveMonitor(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("archive-monitor")),
    snapshot_(std::make_shared<const MonitorSnapshot>()) {
  if(!options_.clock) {
    options_.clock = system_now;
  }
  auto runner = std::make_shared<CommandRunner>(logger_);
  if(!options_.process_probe) {
    options_.process_probe = std::make_shared<ProcessProbe>(runner, logger_, options_.clock);
  }
  if(!options_.filesystem_probe) {
    options_.filesystem_probe = std::make_shared<FilesystemProbe>(runner, logger_);
  }
}

ArchiveMonitor::~ArchiveMonitor() {
  stop();
}

ArchiveMonitor::Config ArchiveMonitor::read_config() const {
  Config config;
  config.farm_root = settings_->get<std::string>("farm_root");
  if(config.farm_root.empty()) {
    throw std::runtime_error("farm_root is not set");
  }
  config.transfer_tool = settings_->get<std::string>("transfer_tool");
  if(config.transfer_tool.empty()) {
    throw std::runtime_error("transfer_tool is not set");
  }
  config.poll_interval = positive_seconds(*settings_, "poll_interval");
  config.ps_timeout = positive_seconds(*settings_, "ps_timeout");
  config.find_timeout = positive_seconds(*settings_, "find_timeout");

  config.bandwidth_correction = settings_->get<double>("bwlimit_correction");
  if(!(config.bandwidth_correction > 0.0)) {
    throw std::runtime_error("bwlimit_correction must be greater than zero");
  }
  int history = settings_->get<int>("max_history_samples");
  if(history < 0) {
    throw std::runtime_error("max_history_samples cannot be negative");
  }
  config.reconcile.max_history_samples = static_cast<std::size_t>(history);
  return config;
}

void ArchiveMonitor::start() {
  if(started_) return;

  LogOptions log_options;
  log_options.verbose = settings_->get<bool>("verbose");
  log_options.log_file = settings_->get<std::string>("log_file");
  init(log_options);

  config_ = read_config();
  started_ = true;
  logger_->info("Watching {} (tool '{}', every {}s)",
                config_.farm_root, config_.transfer_tool, config_.poll_interval.count());

  poll_timer_ = std::make_unique<asio::steady_timer>(io_);
  schedule_poll(std::chrono::steady_clock::duration::zero());
}

void ArchiveMonitor::schedule_poll(std::chrono::steady_clock::duration delay) {
  if(!poll_timer_) return;
  poll_timer_->expires_after(delay);
  poll_timer_->async_wait([this](const std::error_code& ec){
    if(ec || !started_) return;
    try {
      poll_once();
    } catch(const std::exception& e) {
      logger_->error("Polling stopped: {}", e.what());
      {
        std::lock_guard<std::mutex> lock(state_mutex_);
        fatal_error_ = std::current_exception();
      }
      io_.stop();
      return;
    }
    schedule_poll(config_.poll_interval);
  });
}

void ArchiveMonitor::run() {
  if(!started_) start();
  io_.run();
  if(auto error = fatal_error()) {
    std::rethrow_exception(error);
  }
}

void ArchiveMonitor::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void ArchiveMonitor::stop() {
  if(!started_) return;
  started_ = false;

  if(poll_timer_) {
    std::error_code ec;
    poll_timer_->cancel(ec);
  }

  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  poll_timer_.reset();
  io_.restart();
}

std::shared_ptr<const MonitorSnapshot> ArchiveMonitor::poll_once() {
  const Config config = started_ ? config_ : read_config();
  auto previous = snapshot();

  auto next = std::make_shared<MonitorSnapshot>();
  next->cycle = previous->cycle + 1;
  next->bandwidth_correction = config.bandwidth_correction;

  auto egress_result = options_.process_probe->list_egress_candidates(config.transfer_tool,
                                                                      config.ps_timeout);
  if(egress_result.timed_out) {
    next->egress = previous->egress;
    next->egress_stale = true;
  } else {
    next->egress = egress_command::parse_all(egress_result.items);
    if(next->egress.size() != egress_result.items.size()) {
      logger_->debug("Ignored {} non-conforming {} processes",
                     egress_result.items.size() - next->egress.size(), config.transfer_tool);
    }
  }

  const Timestamp observed_at = options_.clock();
  auto ingress_result = options_.filesystem_probe->list_ingress_candidates(config.farm_root,
                                                                           config.find_timeout);
  if(ingress_result.timed_out) {
    next->ingress = previous->ingress;
    next->ingress_stale = true;
  } else {
    auto candidates = job_registry::parse_ingress_candidates(ingress_result.items,
                                                             config.farm_root,
                                                             observed_at);
    if(candidates.size() != ingress_result.items.size()) {
      logger_->debug("Ignored {} files not matching the marker grammar",
                     ingress_result.items.size() - candidates.size());
    }
    next->ingress = job_registry::reconcile(std::move(candidates), previous->ingress, config.reconcile);
  }

  locality_classifier::apply(next->ingress, next->egress);
  next->taken_at = options_.clock();

  logger_->info("Cycle {}: {} ingress{}, {} egress{}",
                next->cycle,
                next->ingress.size(), next->ingress_stale ? " (stale)" : "",
                next->egress.size(), next->egress_stale ? " (stale)" : "");
  for(const auto& job : next->ingress) {
    logger_->debug("  in  {:03d} {} plot={} {} {} local={}",
                   job.disk_index, job.job_id, job.plot_id,
                   format_optional_percent(rate_estimator::progress(job)),
                   format_optional_rate(rate_estimator::rate(job)),
                   job.is_local);
  }
  for(const auto& job : next->egress) {
    logger_->debug("  out {} -> {} plot={} {}",
                   job.source_disk_path, job.destination_tag, job.plot_id,
                   format_optional_percent(rate_estimator::egress_progress(job, next->taken_at,
                                                                           next->bandwidth_correction)));
  }

  publish(next);
  return next;
}

void ArchiveMonitor::publish(std::shared_ptr<const MonitorSnapshot> next) {
  std::atomic_store_explicit(&snapshot_, next, std::memory_order_release);

  std::vector<SnapshotListener> listeners;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    listeners.reserve(listeners_.size());
    for(const auto& entry : listeners_) listeners.push_back(entry.second);
  }
  for(auto& listener : listeners) {
    try {
      listener(next);
    } catch(const std::exception& e) {
      logger_->warn("Snapshot listener failed: {}", e.what());
    }
  }
}

std::shared_ptr<const MonitorSnapshot> ArchiveMonitor::snapshot() const {
  return std::atomic_load_explicit(&snapshot_, std::memory_order_acquire);
}

std::exception_ptr ArchiveMonitor::fatal_error() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return fatal_error_;
}

ArchiveMonitor::SnapshotListenerHandle ArchiveMonitor::add_snapshot_listener(SnapshotListener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(state_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void ArchiveMonitor::remove_snapshot_listener(SnapshotListenerHandle handle) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  listeners_.erase(handle);
}
