#pragma once

#include <cstdint>
#include <optional>

#include "archive_job.hpp"

namespace rate_estimator {

// Throughput discount applied to an egress job's configured bandwidth cap to
// account for protocol and framing overhead. Empirical, not measured.
inline constexpr double kDefaultBandwidthCorrection = 0.8;

// Final on-disk size of a plot of size class k, from a fixed table.
// Only k in [25, 35] is known.
std::optional<uint64_t> expected_plot_size(int plot_k);

std::optional<double> progress(const ArchiveJob& job);

// Bytes/sec measured against the oldest sample in the job's history, so the
// result is a long-run average rather than the last interval's rate.
std::optional<double> rate(const ArchiveJob& job);

// Whole seconds until the expected size is reached at rate(job).
std::optional<int64_t> eta(const ArchiveJob& job);

// Egress jobs have no byte count; progress is projected from elapsed time
// and the bandwidth cap.
std::optional<double> egress_progress(const EgressJob& job,
                                      Timestamp now,
                                      double correction = kDefaultBandwidthCorrection);

std::optional<int64_t> egress_eta(const EgressJob& job,
                                  Timestamp now,
                                  double correction = kDefaultBandwidthCorrection);

} // namespace rate_estimator
