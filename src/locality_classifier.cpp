#include "locality_classifier.hpp"

#include <algorithm>

namespace locality_classifier {

bool classify(const ArchiveJob& ingress, const std::vector<EgressJob>& egress) {
  if(ingress.plot_id.empty()) return false;
  return std::any_of(egress.begin(), egress.end(), [&](const EgressJob& job){
    return job.command_line.find(ingress.plot_id) != std::string::npos;
  });
}

void apply(std::vector<ArchiveJob>& registry, const std::vector<EgressJob>& egress) {
  for(auto& job : registry) {
    job.is_local = classify(job, egress);
  }
}

} // namespace locality_classifier
