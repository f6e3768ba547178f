#include "probes.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <system_error>
#include <unordered_map>

#include "filename_codec.hpp"

namespace {

std::string join_tokens(const std::vector<std::string>& tokens) {
  std::string out;
  for(const auto& token : tokens) {
    if(!out.empty()) out += ' ';
    out += token;
  }
  return out;
}

bool all_digits(const std::string& value) {
  return !value.empty() &&
         std::all_of(value.begin(), value.end(), [](unsigned char ch){ return std::isdigit(ch); });
}

std::string first_line(const std::string& text) {
  auto end = text.find('\n');
  return end == std::string::npos ? text : text.substr(0, end);
}

std::vector<std::string> split_path_segments(const std::string& path) {
  std::vector<std::string> out;
  std::string current;
  for(char ch : path) {
    if(ch == '/') {
      if(!current.empty()) out.push_back(std::move(current));
      current.clear();
    } else {
      current += ch;
    }
  }
  if(!current.empty()) out.push_back(std::move(current));
  return out;
}

std::optional<uint64_t> parse_bandwidth_limit(const std::string& token) {
  if(token.find("bwlimit") == std::string::npos) return std::nullopt;
  auto eq = token.find('=');
  if(eq == std::string::npos) return std::nullopt;
  std::string digits = token.substr(eq + 1);
  if(!all_digits(digits) || digits.size() > 18) return std::nullopt;
  return static_cast<uint64_t>(std::stoull(digits));
}

} // namespace

Timestamp system_now() {
  using namespace std::chrono;
  return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

ProcessProbe::ProcessProbe(std::shared_ptr<CommandRunner> runner,
                           std::shared_ptr<Logger> logger,
                           Clock clock)
  : runner_(std::move(runner)),
    logger_(std::move(logger)),
    clock_(clock ? std::move(clock) : Clock(system_now)) {}

ProbeResult<ProcessCandidate> ProcessProbe::list_egress_candidates(const std::string& tool,
                                                                   std::chrono::seconds timeout) {
  ProbeResult<ProcessCandidate> result;
  CommandResult ps;
  try {
    ps = runner_->run({"ps", "-ww", "-C", tool, "-o", "etimes=", "-o", "args="}, timeout);
  } catch(const std::system_error& e) {
    throw ProbeError(std::string("process listing could not start: ") + e.what());
  }
  if(ps.timed_out) {
    log_warn(logger_.get(), "Process listing for '{}' timed out after {}s", tool, timeout.count());
    result.timed_out = true;
    return result;
  }
  if(!ps.err.empty()) {
    throw ProbeError("process listing failed: " + first_line(ps.err));
  }
  // ps exits 1 with no output when nothing matches.
  result.items = parse_ps_output(ps.out, clock_());
  return result;
}

std::vector<ProcessCandidate> ProcessProbe::parse_ps_output(const std::string& output, Timestamp now) {
  std::vector<ProcessCandidate> out;
  std::unordered_map<std::string, std::size_t> index_by_command;

  std::istringstream lines(output);
  std::string line;
  while(std::getline(lines, line)) {
    std::istringstream fields(line);
    std::string elapsed_token;
    if(!(fields >> elapsed_token) || !all_digits(elapsed_token) || elapsed_token.size() > 12) continue;

    ProcessCandidate candidate;
    std::string token;
    while(fields >> token) candidate.tokens.push_back(token);
    if(candidate.tokens.empty()) continue;
    candidate.started_at = now - static_cast<double>(std::stoll(elapsed_token));

    auto key = join_tokens(candidate.tokens);
    auto it = index_by_command.find(key);
    if(it == index_by_command.end()) {
      index_by_command.emplace(std::move(key), out.size());
      out.push_back(std::move(candidate));
    } else {
      auto& existing = out[it->second];
      existing.started_at = std::min(existing.started_at, candidate.started_at);
    }
  }
  return out;
}

FilesystemProbe::FilesystemProbe(std::shared_ptr<CommandRunner> runner,
                                 std::shared_ptr<Logger> logger)
  : runner_(std::move(runner)),
    logger_(std::move(logger)) {}

ProbeResult<MarkerFileEntry> FilesystemProbe::list_ingress_candidates(const std::string& destination_root,
                                                                      std::chrono::seconds timeout) {
  ProbeResult<MarkerFileEntry> result;
  CommandResult listing;
  try {
    listing = runner_->run({"find", destination_root, "-name", ".plot-k*", "-printf", "%s %p\\n"},
                           timeout);
  } catch(const std::system_error& e) {
    throw ProbeError(std::string("marker listing could not start: ") + e.what());
  }
  if(listing.timed_out) {
    log_warn(logger_.get(), "Marker listing under {} timed out after {}s", destination_root, timeout.count());
    result.timed_out = true;
    return result;
  }
  if(!listing.err.empty()) {
    throw ProbeError("marker listing under " + destination_root + " failed: " + first_line(listing.err));
  }
  result.items = parse_listing(listing.out);
  return result;
}

std::vector<MarkerFileEntry> FilesystemProbe::parse_listing(const std::string& output) {
  std::vector<MarkerFileEntry> out;
  std::istringstream lines(output);
  std::string line;
  while(std::getline(lines, line)) {
    auto space = line.find(' ');
    if(space == std::string::npos) continue;
    std::string size = line.substr(0, space);
    if(!all_digits(size) || size.size() > 18) continue;
    std::string path = line.substr(space + 1);
    if(path.empty()) continue;
    out.push_back(MarkerFileEntry{static_cast<uint64_t>(std::stoull(size)), std::move(path)});
  }
  return out;
}

namespace egress_command {

std::optional<std::string> destination_tag(const std::string& token) {
  auto scheme_end = token.find("://");
  if(scheme_end == std::string::npos) return token;

  std::string rest = token.substr(scheme_end + 3);
  auto slash = rest.find('/');
  if(slash == std::string::npos) return std::nullopt;

  std::string authority = rest.substr(0, slash);
  auto at = authority.rfind('@');
  std::string host = (at == std::string::npos) ? authority : authority.substr(at + 1);
  auto colon = host.find(':');
  if(colon != std::string::npos) host = host.substr(0, colon);
  if(host.empty()) return std::nullopt;

  auto segments = split_path_segments(rest.substr(slash + 1));
  if(segments.size() != 2 || !all_digits(segments[1])) return std::nullopt;
  return "/" + segments[1] + "@" + host;
}

std::optional<EgressJob> parse(const ProcessCandidate& candidate) {
  const auto& tokens = candidate.tokens;
  if(tokens.size() != kTokenCount) return std::nullopt;

  auto bandwidth = parse_bandwidth_limit(tokens[kBandwidthToken]);
  if(!bandwidth) return std::nullopt;
  auto source = filename_codec::parse_source_plot(tokens[kSourceToken]);
  if(!source) return std::nullopt;
  auto destination = destination_tag(tokens[kDestinationToken]);
  if(!destination) return std::nullopt;

  EgressJob job;
  job.plot_id = std::move(source->plot_id);
  job.plot_k = source->plot_k;
  job.created_at = source->created_at;
  job.source_disk_path = std::move(source->source_dir);
  job.destination_tag = std::move(*destination);
  job.bandwidth_limit = *bandwidth;
  job.started_at = candidate.started_at;
  job.command_line = join_tokens(tokens);
  return job;
}

std::vector<EgressJob> parse_all(const std::vector<ProcessCandidate>& candidates) {
  std::vector<EgressJob> out;
  for(const auto& candidate : candidates) {
    if(auto job = parse(candidate)) out.push_back(std::move(*job));
  }
  std::sort(out.begin(), out.end(), [](const EgressJob& a, const EgressJob& b){
    if(a.started_at != b.started_at) return a.started_at < b.started_at;
    return a.plot_id < b.plot_id;
  });
  return out;
}

} // namespace egress_command
