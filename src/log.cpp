#include "log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <atomic>
#include <cstring>
#include <mutex>
#include <vector>

namespace {

constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

struct ConsoleLoggers {
  std::shared_ptr<spdlog::logger> info;
  std::shared_ptr<spdlog::logger> error;
  std::shared_ptr<spdlog::logger> print;
  std::shared_ptr<spdlog::logger> print_err;
};

std::mutex g_loggers_mutex;
ConsoleLoggers g_loggers;
std::shared_ptr<spdlog::sinks::sink> g_file_sink;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            spdlog::sink_ptr console_sink,
                                            spdlog::level::level_enum flush_level) {
  auto logger = std::make_shared<spdlog::logger>(name, std::move(console_sink));
  logger->flush_on(flush_level);
  return logger;
}

void create_loggers_locked() {
  if(g_loggers.info) return;

  auto info_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  info_sink->set_pattern(kStampedPattern);
  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern(kStampedPattern);
  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");
  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_loggers.info = make_logger("archwatch.info", std::move(info_sink), spdlog::level::warn);
  g_loggers.error = make_logger("archwatch.error", std::move(error_sink), spdlog::level::err);
  g_loggers.print = make_logger("archwatch.print", std::move(plain_out_sink), spdlog::level::info);
  g_loggers.print_err = make_logger("archwatch.print_err", std::move(plain_err_sink), spdlog::level::err);
}

// The stamped loggers share the file sink; plain print output stays console-only.
void attach_file_sink_locked(const LogOptions& options) {
  if(g_file_sink) {
    for(auto* logger : {g_loggers.info.get(), g_loggers.error.get()}) {
      auto& sinks = logger->sinks();
      sinks.erase(std::remove(sinks.begin(), sinks.end(), g_file_sink), sinks.end());
    }
    g_file_sink.reset();
  }
  if(options.log_file.empty()) return;

  auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
    options.log_file, options.log_file_max_bytes, options.log_file_count);
  file_sink->set_pattern(kStampedPattern);
  g_file_sink = file_sink;
  g_loggers.info->sinks().push_back(g_file_sink);
  g_loggers.error->sinks().push_back(g_file_sink);
}

spdlog::logger* sink_for_channel(const char* base_channel) {
  std::lock_guard<std::mutex> lock(g_loggers_mutex);
  create_loggers_locked();
  if(std::strcmp(base_channel, "print") == 0) return g_loggers.print.get();
  if(std::strcmp(base_channel, "print_err") == 0) return g_loggers.print_err.get();
  if(std::strcmp(base_channel, "error") == 0) return g_loggers.error.get();
  return g_loggers.info.get();
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void init(const LogOptions& options) {
  std::lock_guard<std::mutex> lock(g_loggers_mutex);
  create_loggers_locked();

  auto level = options.verbose ? spdlog::level::debug : spdlog::level::info;
  g_loggers.info->set_level(level);
  g_loggers.error->set_level(spdlog::level::info);
  g_loggers.print->set_level(spdlog::level::info);
  g_loggers.print_err->set_level(spdlog::level::info);

  // A bad log path is reported but never stops the monitor.
  try {
    attach_file_sink_locked(options);
  } catch(const spdlog::spdlog_ex& e) {
    g_loggers.error->error("Unable to open log file {}: {}", options.log_file, e.what());
  }

  spdlog::set_default_logger(g_loggers.info);
  spdlog::set_level(level);
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> listeners_snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      listeners_snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : listeners_snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_default("error", name_, spdlog::level::err,
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

void Logger::fallback(const char* base_channel,
                      const std::string& channel_name,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  detail::emit_to_default(base_channel, channel_name, level, message);
}

namespace detail {

void emit_to_default(const char* base_channel,
                     const std::string& channel_name,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  if(!log_passthrough()) return;

  auto* sink = sink_for_channel(base_channel);
  if(!sink) return;
  // Print channels carry user-facing output and stay unprefixed.
  const bool plain = std::strcmp(base_channel, "print") == 0 || std::strcmp(base_channel, "print_err") == 0;
  if(!plain && !channel_name.empty() && channel_name != base_channel) {
    sink->log(level, fmt::format("[{}] {}", channel_name, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
