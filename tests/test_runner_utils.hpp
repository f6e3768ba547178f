#pragma once

#include "archive_monitor.hpp"
#include "log.hpp"
#include "probes.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace archwatch::test {

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(
      [this, label](void*,
                    const std::string& channel,
                    spdlog::level::level_enum,
                    const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if(!label.empty()) {
          lines_.emplace_back(label + ": " + message);
        } else {
          lines_.emplace_back(channel + ": " + message);
        }
        cv_.notify_all();
        return false;
      },
      nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, handle});
  }

  void attach(ArchiveMonitor& monitor, const std::string& label = std::string()) {
    attach(monitor.logger(), label);
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

  bool wait_for_substring(const std::string& needle,
                          std::chrono::milliseconds timeout) {
    auto predicate = [&]{
      return std::any_of(lines_.begin(), lines_.end(),
        [&](const std::string& line){ return line.find(needle) != std::string::npos; });
    };
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(!predicate()) {
      if(cv_.wait_until(lock, deadline) == std::cv_status::timeout) break;
    }
    return predicate();
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

inline bool wait_for_condition(std::function<bool()> predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(50)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    if(predicate()) return true;
    std::this_thread::sleep_for(interval);
  }
  return predicate();
}

inline std::filesystem::path prepare_workspace(const std::string& name) {
  auto root = std::filesystem::temp_directory_path() / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

inline void write_sized_file(const std::filesystem::path& path, std::size_t size) {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  std::string block(size, 'x');
  out.write(block.data(), static_cast<std::streamsize>(block.size()));
}

// Test clock advanced by hand.
class ManualClock {
public:
  explicit ManualClock(Timestamp start = 0.0) : now_(std::make_shared<Timestamp>(start)) {}

  Clock clock() const {
    auto now = now_;
    return [now]{ return *now; };
  }

  void set(Timestamp value) { *now_ = value; }
  void advance(double seconds) { *now_ += seconds; }
  Timestamp now() const { return *now_; }

private:
  std::shared_ptr<Timestamp> now_;
};

// Probes that replay queued results instead of running commands. An empty
// queue yields an empty, successful result.
class ScriptedProcessProbe : public ProcessProbe {
public:
  ScriptedProcessProbe() : ProcessProbe(nullptr) {}

  void push(std::vector<ProcessCandidate> items) {
    ProbeResult<ProcessCandidate> result;
    result.items = std::move(items);
    results_.push_back(std::move(result));
  }

  void push_timeout() {
    ProbeResult<ProcessCandidate> result;
    result.timed_out = true;
    results_.push_back(std::move(result));
  }

  void fail_next(std::string message) { failure_ = std::move(message); }

  ProbeResult<ProcessCandidate> list_egress_candidates(const std::string& tool,
                                                       std::chrono::seconds) override {
    last_tool = tool;
    ++calls;
    if(failure_) {
      auto message = *failure_;
      failure_.reset();
      throw ProbeError(message);
    }
    if(results_.empty()) return {};
    auto result = std::move(results_.front());
    results_.pop_front();
    return result;
  }

  std::string last_tool;
  int calls = 0;

private:
  std::deque<ProbeResult<ProcessCandidate>> results_;
  std::optional<std::string> failure_;
};

class ScriptedFilesystemProbe : public FilesystemProbe {
public:
  ScriptedFilesystemProbe() : FilesystemProbe(nullptr) {}

  void push(std::vector<MarkerFileEntry> items) {
    ProbeResult<MarkerFileEntry> result;
    result.items = std::move(items);
    results_.push_back(std::move(result));
  }

  void push_timeout() {
    ProbeResult<MarkerFileEntry> result;
    result.timed_out = true;
    results_.push_back(std::move(result));
  }

  void fail_next(std::string message) { failure_ = std::move(message); }

  ProbeResult<MarkerFileEntry> list_ingress_candidates(const std::string& destination_root,
                                                       std::chrono::seconds) override {
    last_root = destination_root;
    ++calls;
    if(failure_) {
      auto message = *failure_;
      failure_.reset();
      throw ProbeError(message);
    }
    if(results_.empty()) return {};
    auto result = std::move(results_.front());
    results_.pop_front();
    return result;
  }

  std::string last_root;
  int calls = 0;

private:
  std::deque<ProbeResult<MarkerFileEntry>> results_;
  std::optional<std::string> failure_;
};

struct TestCase {
  const char* name;
  std::function<bool()> fn;
};

// Shared driver: prints '.' or 'F' per test and the captured log lines of
// failed tests. Set ARCHWATCH_TEST_LOGS (or pass -v) to see logs live.
inline int run_tests(const char* suite,
                     int argc,
                     char** argv,
                     LogCapture& logs,
                     const std::vector<TestCase>& tests) {
  bool verbose = (std::getenv("ARCHWATCH_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("ARCHWATCH_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  if(suppress_logs) {
    set_log_passthrough(false);
  }

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn();
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}

} // namespace archwatch::test
