#pragma once

#include <optional>
#include <string>

#include "archive_job.hpp"

// Fields of an in-flight marker file:
//   <root>/<disk:3>/.plot-k<k:2>-<YYYY>-<MM>-<DD>-<HH>-<mm>-<plot_id>.plot.<job_id>
struct MarkerFields {
  int disk_index = 0;
  int plot_k = 0;
  Timestamp created_at = 0.0;
  std::string plot_id;
  std::string job_id;
};

// Fields of a finished plot used as an egress source:
//   <dir>/plot-k<k:2>-<YYYY>-<MM>-<DD>-<HH>-<mm>-<plot_id>.plot
struct SourcePlotFields {
  std::string source_dir;
  int plot_k = 0;
  Timestamp created_at = 0.0;
  std::string plot_id;
};

namespace filename_codec {

// root_prefix is compared literally; a trailing '/' is ignored.
// Anything that does not fit the grammar exactly yields std::nullopt.
std::optional<MarkerFields> parse_marker(const std::string& path,
                                         const std::string& root_prefix);

std::optional<SourcePlotFields> parse_source_plot(const std::string& path);

// Local-time minute timestamp; nullopt for impossible calendar values.
std::optional<Timestamp> make_plot_timestamp(int year, int month, int day,
                                             int hour, int minute);

} // namespace filename_codec
