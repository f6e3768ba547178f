#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Timestamps are seconds since the Unix epoch.
using Timestamp = double;

struct ByteSample {
  Timestamp timestamp = 0.0;
  uint64_t transferred_bytes = 0;
};

// An inbound copy observed from the destination side through its
// partially written `.plot-k...plot.<job>` marker file.
struct ArchiveJob {
  std::string job_id;
  std::string plot_id;
  int plot_k = 0;
  Timestamp created_at = 0.0;
  int disk_index = 0;
  uint64_t transferred_bytes = 0;
  // Oldest first. Each re-observation appends the previous cycle's sample.
  std::vector<ByteSample> sample_history;
  Timestamp observed_at = 0.0;
  bool is_local = false;
};

// An outbound transfer process seen in the process table.
struct EgressJob {
  std::string plot_id;
  int plot_k = 0;
  Timestamp created_at = 0.0;
  std::string source_disk_path;
  // Either a plain local path or "/<disk>@<host>".
  std::string destination_tag;
  uint64_t bandwidth_limit = 0; // bytes/sec
  Timestamp started_at = 0.0;
  std::string command_line;
};
