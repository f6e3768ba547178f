#include "job_registry.hpp"

#include <algorithm>
#include <unordered_map>

#include "filename_codec.hpp"

namespace job_registry {

std::vector<ArchiveJob> parse_ingress_candidates(const std::vector<MarkerFileEntry>& entries,
                                                 const std::string& farm_root,
                                                 Timestamp observed_at) {
  std::vector<ArchiveJob> out;
  out.reserve(entries.size());
  for(const auto& entry : entries) {
    auto fields = filename_codec::parse_marker(entry.path, farm_root);
    if(!fields) continue;

    ArchiveJob job;
    job.job_id = std::move(fields->job_id);
    job.plot_id = std::move(fields->plot_id);
    job.plot_k = fields->plot_k;
    job.created_at = fields->created_at;
    job.disk_index = fields->disk_index;
    job.transferred_bytes = entry.size;
    job.observed_at = observed_at;
    out.push_back(std::move(job));
  }
  return out;
}

IngressRegistry reconcile(std::vector<ArchiveJob> candidates,
                          const IngressRegistry& previous,
                          const ReconcileOptions& options) {
  std::unordered_map<std::string, const ArchiveJob*> previous_by_id;
  previous_by_id.reserve(previous.size());
  for(const auto& job : previous) {
    previous_by_id.emplace(job.job_id, &job);
  }

  IngressRegistry next;
  next.reserve(candidates.size());
  for(auto& candidate : candidates) {
    candidate.sample_history.clear();
    auto it = previous_by_id.find(candidate.job_id);
    if(it != previous_by_id.end()) {
      const ArchiveJob& prior = *it->second;
      candidate.sample_history = prior.sample_history;
      candidate.sample_history.push_back(ByteSample{prior.observed_at, prior.transferred_bytes});
      if(options.max_history_samples > 0 &&
         candidate.sample_history.size() > options.max_history_samples) {
        auto excess = candidate.sample_history.size() - options.max_history_samples;
        candidate.sample_history.erase(candidate.sample_history.begin(),
                                       candidate.sample_history.begin() + static_cast<std::ptrdiff_t>(excess));
      }
    }
    next.push_back(std::move(candidate));
  }

  std::sort(next.begin(), next.end(), [](const ArchiveJob& a, const ArchiveJob& b){
    if(a.disk_index != b.disk_index) return a.disk_index < b.disk_index;
    return a.job_id < b.job_id;
  });
  return next;
}

} // namespace job_registry
