#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "log.hpp"

struct CommandResult {
  // Exit code, or 128 + signal number when the child was killed.
  int exit_status = -1;
  std::string out;
  std::string err;
  bool timed_out = false;
};

// Runs an external command and collects its output. The child is killed
// if it is still running when the timeout expires; whatever it had written
// by then is kept.
class CommandRunner {
public:
  explicit CommandRunner(std::shared_ptr<Logger> logger = nullptr);
  virtual ~CommandRunner() = default;

  // argv[0] is resolved through PATH. Throws std::system_error if the
  // child cannot be created; an exec failure is reported on `err` with
  // exit status 127.
  virtual CommandResult run(const std::vector<std::string>& argv,
                            std::chrono::milliseconds timeout);

private:
  std::shared_ptr<Logger> logger_;
};
