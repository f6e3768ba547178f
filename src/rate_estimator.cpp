#include "rate_estimator.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

namespace {

struct PlotSizeEntry {
  int k;
  uint64_t bytes;
};

// ((2k + 1) * 2^(k - 1) * 0.762), truncated.
constexpr std::array<PlotSizeEntry, 11> kPlotSizes = {{
  {25, 651996168ULL},
  {26, 1355129290ULL},
  {27, 2812532490ULL},
  {28, 5829612797ULL},
  {29, 12068321230ULL},
  {30, 24954833731ULL},
  {31, 51546050002ULL},
  {32, 106364865085ULL},
  {33, 219275260329ULL},
  {34, 451641580978ULL},
  {35, 929465282592ULL},
}};

double clamp_unit(double value) {
  return std::clamp(value, 0.0, 1.0);
}

// Saturates at the int64_t maximum; a negative rate means nothing is left.
std::optional<int64_t> whole_seconds_remaining(double remaining_bytes, double bytes_per_sec) {
  if(bytes_per_sec == 0.0 || std::isnan(bytes_per_sec)) return std::nullopt;
  const double seconds = std::max(0.0, remaining_bytes / bytes_per_sec);
  constexpr double kMaxSeconds = static_cast<double>(std::numeric_limits<int64_t>::max());
  if(seconds >= kMaxSeconds) return std::numeric_limits<int64_t>::max();
  return static_cast<int64_t>(std::floor(seconds));
}

} // namespace

namespace rate_estimator {

std::optional<uint64_t> expected_plot_size(int plot_k) {
  for(const auto& entry : kPlotSizes) {
    if(entry.k == plot_k) return entry.bytes;
  }
  return std::nullopt;
}

std::optional<double> progress(const ArchiveJob& job) {
  auto expected = expected_plot_size(job.plot_k);
  if(!expected) return std::nullopt;
  return clamp_unit(static_cast<double>(job.transferred_bytes) / static_cast<double>(*expected));
}

std::optional<double> rate(const ArchiveJob& job) {
  if(job.sample_history.empty()) return std::nullopt;
  const ByteSample& oldest = job.sample_history.front();
  const double elapsed = job.observed_at - oldest.timestamp;
  if(elapsed == 0.0) return std::nullopt;
  const double delta = static_cast<double>(job.transferred_bytes) -
                       static_cast<double>(oldest.transferred_bytes);
  return delta / elapsed;
}

std::optional<int64_t> eta(const ArchiveJob& job) {
  auto bytes_per_sec = rate(job);
  if(!bytes_per_sec || *bytes_per_sec == 0.0) return std::nullopt;
  auto expected = expected_plot_size(job.plot_k);
  if(!expected) return std::nullopt;
  const double remaining = static_cast<double>(*expected) -
                           static_cast<double>(job.transferred_bytes);
  return whole_seconds_remaining(remaining, *bytes_per_sec);
}

std::optional<double> egress_progress(const EgressJob& job, Timestamp now, double correction) {
  auto expected = expected_plot_size(job.plot_k);
  if(!expected) return std::nullopt;
  const double elapsed = std::max(0.0, now - job.started_at);
  const double projected = elapsed * static_cast<double>(job.bandwidth_limit) * correction;
  return clamp_unit(projected / static_cast<double>(*expected));
}

std::optional<int64_t> egress_eta(const EgressJob& job, Timestamp now, double correction) {
  auto expected = expected_plot_size(job.plot_k);
  if(!expected) return std::nullopt;
  const double effective_rate = static_cast<double>(job.bandwidth_limit) * correction;
  const double elapsed = std::max(0.0, now - job.started_at);
  if(!(effective_rate > 0.0)) return std::nullopt;
  const double remaining = static_cast<double>(*expected) - elapsed * effective_rate;
  return whole_seconds_remaining(remaining, effective_rate);
}

} // namespace rate_estimator
