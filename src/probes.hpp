#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "archive_job.hpp"
#include "command_runner.hpp"
#include "job_registry.hpp"
#include "log.hpp"

// A probe call wrote to its error stream or could not be started. The
// current cycle cannot be trusted and the polling loop stops.
class ProbeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

template<typename T>
struct ProbeResult {
  std::vector<T> items;
  // Set when the probe hit its timeout; items is then empty.
  bool timed_out = false;
};

struct ProcessCandidate {
  std::vector<std::string> tokens;
  Timestamp started_at = 0.0;
};

using Clock = std::function<Timestamp()>;
Timestamp system_now();

// Lists running invocations of the transfer tool from the process table.
class ProcessProbe {
public:
  ProcessProbe(std::shared_ptr<CommandRunner> runner,
               std::shared_ptr<Logger> logger = nullptr,
               Clock clock = system_now);
  virtual ~ProcessProbe() = default;

  // Processes sharing an identical command line are reported once, with the
  // earliest start time. Throws ProbeError on error-stream output.
  virtual ProbeResult<ProcessCandidate> list_egress_candidates(const std::string& tool,
                                                               std::chrono::seconds timeout);

  // Parses `ps -o etimes= -o args=` output relative to `now`.
  static std::vector<ProcessCandidate> parse_ps_output(const std::string& output, Timestamp now);

private:
  std::shared_ptr<CommandRunner> runner_;
  std::shared_ptr<Logger> logger_;
  Clock clock_;
};

// Lists in-flight marker files below the farm root.
class FilesystemProbe {
public:
  explicit FilesystemProbe(std::shared_ptr<CommandRunner> runner,
                           std::shared_ptr<Logger> logger = nullptr);
  virtual ~FilesystemProbe() = default;

  // A timeout is logged and reported through ProbeResult::timed_out.
  // Throws ProbeError on error-stream output.
  virtual ProbeResult<MarkerFileEntry> list_ingress_candidates(const std::string& destination_root,
                                                               std::chrono::seconds timeout);

  // Parses "<size> <path>" lines.
  static std::vector<MarkerFileEntry> parse_listing(const std::string& output);

private:
  std::shared_ptr<CommandRunner> runner_;
  std::shared_ptr<Logger> logger_;
};

namespace egress_command {

inline constexpr std::size_t kTokenCount = 9;
inline constexpr std::size_t kBandwidthToken = 1;
inline constexpr std::size_t kSourceToken = 7;
inline constexpr std::size_t kDestinationToken = 8;

// Rewrites scheme://[user@]host[:port]/module/<disk>/ to "/<disk>@<host>".
// A token without "://" is a local path and is returned unchanged.
std::optional<std::string> destination_tag(const std::string& token);

// Anything but exactly kTokenCount tokens with a parseable bandwidth limit,
// source plot and destination is rejected.
std::optional<EgressJob> parse(const ProcessCandidate& candidate);

std::vector<EgressJob> parse_all(const std::vector<ProcessCandidate>& candidates);

} // namespace egress_command
