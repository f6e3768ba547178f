#include "monitor_snapshot.hpp"

#include <fstream>
#include <optional>
#include <system_error>

namespace {

template<typename T>
nlohmann::json or_null(const std::optional<T>& value) {
  if(!value) return nullptr;
  return *value;
}

} // namespace

namespace snapshot_json {

nlohmann::json to_json(const ArchiveJob& job) {
  nlohmann::json history = nlohmann::json::array();
  for(const auto& sample : job.sample_history) {
    history.push_back({{"timestamp", sample.timestamp}, {"transferred_bytes", sample.transferred_bytes}});
  }
  return {
    {"job_id", job.job_id},
    {"plot_id", job.plot_id},
    {"plot_k", job.plot_k},
    {"created_at", job.created_at},
    {"disk_index", job.disk_index},
    {"transferred_bytes", job.transferred_bytes},
    {"observed_at", job.observed_at},
    {"expected_bytes", or_null(rate_estimator::expected_plot_size(job.plot_k))},
    {"progress", or_null(rate_estimator::progress(job))},
    {"rate", or_null(rate_estimator::rate(job))},
    {"eta", or_null(rate_estimator::eta(job))},
    {"is_local", job.is_local},
    {"sample_history", std::move(history)}
  };
}

nlohmann::json to_json(const EgressJob& job, Timestamp now, double bandwidth_correction) {
  return {
    {"plot_id", job.plot_id},
    {"plot_k", job.plot_k},
    {"created_at", job.created_at},
    {"source_disk_path", job.source_disk_path},
    {"destination_tag", job.destination_tag},
    {"bandwidth_limit", job.bandwidth_limit},
    {"started_at", job.started_at},
    {"progress", or_null(rate_estimator::egress_progress(job, now, bandwidth_correction))},
    {"eta", or_null(rate_estimator::egress_eta(job, now, bandwidth_correction))},
    {"command_line", job.command_line}
  };
}

nlohmann::json to_json(const MonitorSnapshot& snapshot) {
  nlohmann::json ingress = nlohmann::json::array();
  for(const auto& job : snapshot.ingress) ingress.push_back(to_json(job));
  nlohmann::json egress = nlohmann::json::array();
  for(const auto& job : snapshot.egress) {
    egress.push_back(to_json(job, snapshot.taken_at, snapshot.bandwidth_correction));
  }
  return {
    {"cycle", snapshot.cycle},
    {"taken_at", snapshot.taken_at},
    {"ingress_stale", snapshot.ingress_stale},
    {"egress_stale", snapshot.egress_stale},
    {"ingress", std::move(ingress)},
    {"egress", std::move(egress)}
  };
}

bool write_file(const MonitorSnapshot& snapshot, const std::filesystem::path& path, std::string& error) {
  auto temp_path = path;
  temp_path += ".tmp";
  {
    std::ofstream out(temp_path, std::ios::trunc);
    if(!out) {
      error = "unable to open " + temp_path.string();
      return false;
    }
    out << to_json(snapshot).dump(2) << '\n';
    if(!out) {
      error = "short write to " + temp_path.string();
      return false;
    }
  }
  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if(ec) {
    error = "rename to " + path.string() + " failed: " + ec.message();
    return false;
  }
  return true;
}

} // namespace snapshot_json
