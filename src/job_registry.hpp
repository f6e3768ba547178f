#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "archive_job.hpp"

// Raw (size, path) pair reported by the filesystem probe.
struct MarkerFileEntry {
  uint64_t size = 0;
  std::string path;
};

using IngressRegistry = std::vector<ArchiveJob>;

namespace job_registry {

struct ReconcileOptions {
  // 0 keeps every sample for the lifetime of the job.
  std::size_t max_history_samples = 0;
};

// Parses each marker file under farm_root into a fresh record with an empty
// history. Entries that do not match the marker grammar are skipped.
std::vector<ArchiveJob> parse_ingress_candidates(const std::vector<MarkerFileEntry>& entries,
                                                 const std::string& farm_root,
                                                 Timestamp observed_at);

// Builds the next registry from this cycle's candidates. A candidate whose
// job_id was in the previous registry inherits that record's history plus
// its last observation. Previous records not seen again are dropped.
// The result is ordered by (disk_index, job_id).
IngressRegistry reconcile(std::vector<ArchiveJob> candidates,
                          const IngressRegistry& previous,
                          const ReconcileOptions& options = ReconcileOptions{});

} // namespace job_registry
