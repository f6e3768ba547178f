#pragma once

#include <string>
#include <vector>

#include "archive_job.hpp"

namespace locality_classifier {

// True when the ingress job's plot id occurs anywhere in the raw command
// line of a concurrently running egress transfer. Only transfers that parsed
// as egress jobs are searched. Plain substring search, so a short plot id can
// match an unrelated command.
bool classify(const ArchiveJob& ingress, const std::vector<EgressJob>& egress);

// Sets is_local on every record of the registry.
void apply(std::vector<ArchiveJob>& registry, const std::vector<EgressJob>& egress);

} // namespace locality_classifier
