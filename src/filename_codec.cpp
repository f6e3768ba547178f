#include "filename_codec.hpp"

#include <ctime>
#include <regex>

namespace {

// Everything after "<root>/". Digit widths are fixed, identifiers are
// alphanumeric and no field may contain a path separator.
const std::regex& marker_pattern() {
  static const std::regex pattern(
    R"(^(\d{3})/\.plot-k(\d{2})-(\d{4})-(\d{2})-(\d{2})-(\d{2})-(\d{2})-([A-Za-z0-9]+)\.plot\.([A-Za-z0-9]+)$)");
  return pattern;
}

const std::regex& source_plot_pattern() {
  static const std::regex pattern(
    R"(^(.*)/plot-k(\d{2})-(\d{4})-(\d{2})-(\d{2})-(\d{2})-(\d{2})-([A-Za-z0-9]+)\.plot$)");
  return pattern;
}

int digits_to_int(const std::ssub_match& group) {
  int value = 0;
  for(char ch : group.str()) {
    value = value * 10 + (ch - '0');
  }
  return value;
}

bool is_leap_year(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
  static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if(month == 2 && is_leap_year(year)) return 29;
  return kDays[month - 1];
}

std::string strip_trailing_slashes(std::string root) {
  while(root.size() > 1 && root.back() == '/') root.pop_back();
  if(root == "/") root.clear();
  return root;
}

} // namespace

namespace filename_codec {

std::optional<Timestamp> make_plot_timestamp(int year, int month, int day,
                                             int hour, int minute) {
  if(month < 1 || month > 12) return std::nullopt;
  if(day < 1 || day > days_in_month(year, month)) return std::nullopt;
  if(hour < 0 || hour > 23) return std::nullopt;
  if(minute < 0 || minute > 59) return std::nullopt;

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = 0;
  tm.tm_isdst = -1;
  std::time_t t = std::mktime(&tm);
  if(t == static_cast<std::time_t>(-1)) return std::nullopt;
  return static_cast<Timestamp>(t);
}

std::optional<MarkerFields> parse_marker(const std::string& path,
                                         const std::string& root_prefix) {
  const std::string root = strip_trailing_slashes(root_prefix) + "/";
  if(path.size() <= root.size()) return std::nullopt;
  if(path.compare(0, root.size(), root) != 0) return std::nullopt;

  const std::string remainder = path.substr(root.size());
  std::smatch m;
  if(!std::regex_match(remainder, m, marker_pattern())) return std::nullopt;

  auto created_at = make_plot_timestamp(digits_to_int(m[3]), digits_to_int(m[4]),
                                        digits_to_int(m[5]), digits_to_int(m[6]),
                                        digits_to_int(m[7]));
  if(!created_at) return std::nullopt;

  MarkerFields fields;
  fields.disk_index = digits_to_int(m[1]);
  fields.plot_k = digits_to_int(m[2]);
  fields.created_at = *created_at;
  fields.plot_id = m[8].str();
  fields.job_id = m[9].str();
  return fields;
}

std::optional<SourcePlotFields> parse_source_plot(const std::string& path) {
  std::smatch m;
  if(!std::regex_match(path, m, source_plot_pattern())) return std::nullopt;

  auto created_at = make_plot_timestamp(digits_to_int(m[3]), digits_to_int(m[4]),
                                        digits_to_int(m[5]), digits_to_int(m[6]),
                                        digits_to_int(m[7]));
  if(!created_at) return std::nullopt;

  SourcePlotFields fields;
  fields.source_dir = m[1].str();
  fields.plot_k = digits_to_int(m[2]);
  fields.created_at = *created_at;
  fields.plot_id = m[8].str();
  return fields;
}

} // namespace filename_codec
