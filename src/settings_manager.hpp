#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","farm_root"},           {"aliases", {"root","fr"}},      {"type","string"}, {"default",""},      {"description","Archive farm root holding the numbered disk directories"}, {"persistent", true}},
  {{"key","transfer_tool"},       {"aliases", {"tool"}},           {"type","string"}, {"default","rsync"}, {"description","Executable name of the egress transfer tool"}, {"persistent", true}},
  {{"key","poll_interval"},       {"aliases", {"interval","pi"}},  {"type","int"},    {"default",20},      {"description","Seconds between polling cycles"}, {"persistent", true}},
  {{"key","ps_timeout"},          {"aliases", {"pst"}},            {"type","int"},    {"default",20},      {"description","Seconds allowed for the process table listing"}, {"persistent", true}},
  {{"key","find_timeout"},        {"aliases", {"ft"}},             {"type","int"},    {"default",40},      {"description","Seconds allowed for the marker file listing"}, {"persistent", true}},
  {{"key","bwlimit_correction"},  {"aliases", {"correction","bc"}},{"type","float"},  {"default",0.8},     {"description","Fraction of the egress bandwidth cap assumed to carry payload"}, {"persistent", true}},
  {{"key","max_history_samples"}, {"aliases", {"history","mhs"}},  {"type","int"},    {"default",0},       {"description","Samples kept per ingress job (0 = unbounded)"}, {"persistent", true}},
  {{"key","snapshot_file"},       {"aliases", {"snapshot","sf"}},  {"type","string"}, {"default",""},      {"description","Write the JSON snapshot here after every cycle"}, {"persistent", true}},
  {{"key","log_file"},            {"aliases", {"lf"}},             {"type","string"}, {"default",""},      {"description","Also log to this rotating file"}, {"persistent", true}},
  {{"key","verbose"},             {"aliases", {"v"}},              {"type","bool"},   {"default",false},   {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","once"},                {"aliases", {"o"}},              {"type","bool"},   {"default",false},   {"description","Run a single cycle, print the snapshot and exit"}, {"persistent", false}},
  {{"key","help"},                {"aliases", {"h","?"}},          {"type","bool"},   {"default",false},   {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                {"aliases", {"persist"}},        {"type","bool"},   {"default",false},   {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool save() const;
  bool load();

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json get_json(bool persistent_only = true) const;
  const nlohmann::json& specification() const { return specification_; }

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static bool is_bool_literal(const std::string& value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json default_value;
    bool persistent = true;
  };

  const SettingSpec* find_spec(const std::string& token) const;
  void merge_from_json(const nlohmann::json& doc);
  bool store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json specification_;
  std::vector<SettingSpec> specs_;
  nlohmann::json values_;
  std::filesystem::path settings_path_;
};

// ---- implementation -------------------------------------------------------

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : specification_(specification),
    values_(nlohmann::json::object()) {
  for(const auto& entry : specification_) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
      spec.aliases.push_back(to_lower(alias));
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.persistent = entry.value("persistent", true);
    values_[spec.key] = spec.default_value;
    specs_.push_back(std::move(spec));
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  const std::string lowered = to_lower(token);
  for(const auto& spec : specs_) {
    if(lowered == to_lower(spec.key)) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  return values_.contains(key);
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_ = path;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_.empty()) return settings_path_;
  return std::filesystem::current_path() / ".config" / "archwatch.json";
}

// A missing file is not an error; a malformed one is reported and ignored.
inline bool SettingsManager::load() {
  const auto path = settings_path();
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

inline bool SettingsManager::save() const {
  const auto path = settings_path();
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2);
  return static_cast<bool>(out);
}

inline void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!store(*spec, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

inline nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : specs_) {
    if(persistent_only && !spec.persistent) continue;
    doc[spec.key] = values_.at(spec.key);
  }
  return doc;
}

inline bool SettingsManager::store(const SettingSpec& spec,
                                   const nlohmann::json& value,
                                   std::string& error) {
  if(spec.type == "bool" && value.is_boolean()) {
    values_[spec.key] = value.get<bool>();
    return true;
  }
  if(spec.type == "int" && value.is_number_integer()) {
    values_[spec.key] = value.get<int>();
    return true;
  }
  if(spec.type == "float" && value.is_number()) {
    values_[spec.key] = value.get<double>();
    return true;
  }
  if(spec.type == "string" && value.is_string()) {
    values_[spec.key] = value.get<std::string>();
    return true;
  }
  error = "expected " + spec.type;
  return false;
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                          const std::string& value,
                                                          std::string& error) const {
  error.clear();
  const std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    const std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  try {
    std::size_t consumed = 0;
    if(spec.type == "int") {
      int parsed = std::stoi(clean, &consumed);
      if(consumed == clean.size()) return parsed;
    } else if(spec.type == "float") {
      double parsed = std::stod(clean, &consumed);
      if(consumed == clean.size()) return parsed;
    } else {
      return clean;
    }
  } catch(const std::logic_error& e) {
    error = e.what();
    return {};
  }
  error = "trailing characters in '" + clean + "'";
  return {};
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return store(*spec, parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return store(*spec, value, error);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

inline bool SettingsManager::is_bool_literal(const std::string& value) {
  const std::string lowered = to_lower(trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return values_.at(key).get<T>();
}
