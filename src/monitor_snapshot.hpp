#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "archive_job.hpp"
#include "job_registry.hpp"
#include "rate_estimator.hpp"

// Immutable result of one polling cycle, shared read-only with consumers.
struct MonitorSnapshot {
  uint64_t cycle = 0;
  Timestamp taken_at = 0.0;
  // Set when a probe timed out and the previous cycle's jobs were carried over.
  bool ingress_stale = false;
  bool egress_stale = false;
  IngressRegistry ingress;
  std::vector<EgressJob> egress;
  double bandwidth_correction = rate_estimator::kDefaultBandwidthCorrection;
};

namespace snapshot_json {

nlohmann::json to_json(const ArchiveJob& job);
nlohmann::json to_json(const EgressJob& job, Timestamp now, double bandwidth_correction);
nlohmann::json to_json(const MonitorSnapshot& snapshot);

// Writes through a temporary file and renames it into place, so readers
// never see a partial document.
bool write_file(const MonitorSnapshot& snapshot, const std::filesystem::path& path, std::string& error);

} // namespace snapshot_json
