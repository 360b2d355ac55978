#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","daemon_path"},         {"aliases", {"aria2c"}},          {"type","string"}, {"default",""},          {"description","Explicit path to the aria2c binary (searched when empty)"}, {"persistent", true}},
  {{"key","resource_dir"},        {"aliases", {"resources"}},       {"type","string"}, {"default",""},          {"description","Bundled resource directory searched first for aria2c"}, {"persistent", true}},
  {{"key","rpc_host"},            {"aliases", {"rh"}},              {"type","string"}, {"default","127.0.0.1"}, {"description","Daemon RPC host (local only)"}, {"persistent", true}},
  {{"key","rpc_port"},            {"aliases", {"rp"}},              {"type","int"},    {"default",6800},        {"description","Daemon RPC port"}, {"persistent", true}, {"min",1}, {"max",65535}},
  {{"key","rpc_secret"},          {"aliases", {"secret"}},          {"type","string"}, {"default",""},          {"description","Shared RPC secret (empty = none)"}, {"persistent", true}},
  {{"key","rpc_timeout_ms"},      {"aliases", {"rto"}},             {"type","int"},    {"default",10000},       {"description","Timeout for one RPC call in milliseconds"}, {"persistent", true}, {"min",100}},
  {{"key","startup_timeout_ms"},  {"aliases", {"sto"}},             {"type","int"},    {"default",30000},       {"description","How long to wait for a spawned daemon to answer"}, {"persistent", true}, {"min",100}},
  {{"key","shutdown_timeout_ms"}, {"aliases", {"shto"}},            {"type","int"},    {"default",5000},        {"description","Grace period before the daemon is killed"}, {"persistent", true}, {"min",0}},
  {{"key","download_dir"},        {"aliases", {"dir","d"}},         {"type","string"}, {"default","downloads"}, {"description","Default destination directory"}, {"persistent", true}},
  {{"key","split"},               {"aliases", {"s"}},               {"type","int"},    {"default",4},           {"description","Segments per HTTP download"}, {"persistent", true}, {"min",1}, {"max",16}},
  {{"key","max_connections_per_server"}, {"aliases", {"mcs"}},      {"type","int"},    {"default",4},           {"description","Connections per server for HTTP downloads"}, {"persistent", true}, {"min",1}, {"max",16}},
  {{"key","max_concurrent_downloads"},   {"aliases", {"mcd"}},      {"type","int"},    {"default",5},           {"description","Daemon-wide concurrent download ceiling"}, {"persistent", true}, {"min",1}},
  {{"key","min_split_size"},      {"aliases", {"mss"}},             {"type","size"},   {"default",1048576},     {"description","Smallest segment the daemon will split off (1M..1024M)"}, {"persistent", true}, {"min",1048576}, {"max",1073741824}},
  {{"key","sample_interval_ms"},  {"aliases", {"tick"}},            {"type","int"},    {"default",1000},        {"description","Progress sampling period in milliseconds"}, {"persistent", true}, {"min",10}},
  {{"key","completed_grace_ms"},  {"aliases", {"grace"}},           {"type","int"},    {"default",5000},        {"description","Delay before a completed task is released from its backend"}, {"persistent", true}, {"min",0}},
  {{"key","cleanup_policy"},      {"aliases", {"cleanup"}},         {"type","string"}, {"default","persist"},   {"description","Partial data on cancel: persist|temp"}, {"persistent", true}, {"choices", {"persist","temp"}}},
  {{"key","peer_listen_port"},    {"aliases", {"plp"}},             {"type","int"},    {"default",6881},        {"description","Swarm listen port (0 = any)"}, {"persistent", true}, {"min",0}, {"max",65535}},
  {{"key","peer_max_connections"},{"aliases", {"pmc"}},             {"type","int"},    {"default",200},         {"description","Swarm connection limit"}, {"persistent", true}, {"min",1}},
  {{"key","enable_dht"},          {"aliases", {"dht"}},             {"type","bool"},   {"default",true},        {"description","Use the DHT to find peers"}, {"persistent", true}},
  {{"key","enable_lsd"},          {"aliases", {"lsd"}},             {"type","bool"},   {"default",true},        {"description","Use local service discovery"}, {"persistent", true}},
  {{"key","download_rate_limit"}, {"aliases", {"dlr"}},             {"type","size"},   {"default",0},           {"description","Download limit per transport in bytes/s (0 = none)"}, {"persistent", true}, {"min",0}},
  {{"key","upload_rate_limit"},   {"aliases", {"ulr"}},             {"type","size"},   {"default",1024},        {"description","Swarm upload limit in bytes/s (0 = none)"}, {"persistent", true}, {"min",0}},
  {{"key","seed_after_download"}, {"aliases", {"seed"}},            {"type","bool"},   {"default",true},        {"description","Keep seeding swarm downloads until stopped"}, {"persistent", true}},
  {{"key","history_path"},        {"aliases", {"history"}},         {"type","string"}, {"default",""},          {"description","Download history file (default .config/history.jsonl)"}, {"persistent", true}},
  {{"key","log_file"},            {"aliases", {"log"}},             {"type","string"}, {"default",""},          {"description","Also write log lines to this file"}, {"persistent", true}},
  {{"key","verbose"},             {"aliases", {"v"}},               {"type","bool"},   {"default",false},       {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                {"aliases", {"h","?"}},           {"type","bool"},   {"default",false},       {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                {"aliases", {"persist"}},         {"type","bool"},   {"default",false},       {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  std::chrono::milliseconds get_ms(const std::string& key) const {
    return std::chrono::milliseconds(get<int>(key));
  }

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool save() const;
  bool load();
  // HAUL_RPC_SECRET=... style overrides; applied after load(), before argv.
  void apply_environment(const std::string& prefix = "HAUL_");
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);
  std::filesystem::path config_dir() const { return settings_path().parent_path(); }

  nlohmann::json get_json(bool persistent_only = true) const;
  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  // "512K", "4M", "1G" or plain bytes; binary multiples.
  static std::optional<long long> parse_size(const std::string& value);

private:
  enum class SettingType { Bool, Int, Size, String };

  struct SettingSpec {
    std::string key;
    std::vector<std::string> names; // lowered key first, then aliases
    SettingType type = SettingType::String;
    nlohmann::json default_value;
    bool persistent = true;
    std::optional<long long> min;
    std::optional<long long> max;
    std::vector<std::string> choices;
  };

  static SettingType type_from_name(const std::string& name);
  static SettingSpec spec_from_entry(const nlohmann::json& entry);
  const SettingSpec* find_spec(const std::string& token) const;

  bool store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  static std::optional<nlohmann::json> coerce(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  static std::optional<nlohmann::json> from_text(const SettingSpec& spec, const std::string& text, std::string& error);
  static bool within_limits(const SettingSpec& spec, const nlohmann::json& value, std::string& error);

  nlohmann::json settings_ = nlohmann::json::object();
  std::vector<SettingSpec> setting_specs_;
  std::filesystem::path settings_path_override_;
};

// ---- implementation -------------------------------------------------------

inline SettingsManager::SettingType SettingsManager::type_from_name(const std::string& name) {
  if(name == "bool") return SettingType::Bool;
  if(name == "int") return SettingType::Int;
  if(name == "size") return SettingType::Size;
  if(name == "string") return SettingType::String;
  throw std::invalid_argument("unknown setting type '" + name + "'");
}

inline SettingsManager::SettingSpec SettingsManager::spec_from_entry(const nlohmann::json& entry) {
  SettingSpec spec;
  spec.key = entry.at("key").get<std::string>();
  spec.names.push_back(to_lower(spec.key));
  for(const auto& alias : entry.value("aliases", nlohmann::json::array())) {
    spec.names.push_back(to_lower(alias.get<std::string>()));
  }
  spec.type = type_from_name(entry.at("type").get<std::string>());
  spec.default_value = entry.at("default");
  spec.persistent = entry.value("persistent", true);
  if(entry.contains("min")) spec.min = entry.at("min").get<long long>();
  if(entry.contains("max")) spec.max = entry.at("max").get<long long>();
  spec.choices = entry.value("choices", std::vector<std::string>());
  return spec;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification) {
  for(const auto& entry : specification) {
    setting_specs_.push_back(spec_from_entry(entry));
    settings_[setting_specs_.back().key] = setting_specs_.back().default_value;
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string wanted = to_lower(token);
  std::replace(wanted.begin(), wanted.end(), '-', '_');
  auto it = std::find_if(setting_specs_.begin(), setting_specs_.end(), [&](const SettingSpec& spec){
    return std::find(spec.names.begin(), spec.names.end(), wanted) != spec.names.end();
  });
  return it == setting_specs_.end() ? nullptr : &*it;
}

inline bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

inline std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  for(const auto& spec : setting_specs_) out.push_back(spec.key);
  return out;
}

inline std::string SettingsManager::value_as_string(const std::string& key) const {
  auto it = settings_.find(key);
  if(it == settings_.end()) return "<unknown>";
  if(it->is_string()) return it->get<std::string>();
  return it->dump();
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(settings_path_override_.empty()) {
    return std::filesystem::current_path() / ".config" / "settings.json";
  }
  return settings_path_override_;
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

// Unknown and non-persistent keys in the file are skipped; a bad value keeps
// the current one.
inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(path.empty() || !in) return false;

  nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
  if(doc.is_discarded() || !doc.is_object()) {
    console_err("Failed to parse {}: expected a JSON object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec || !spec->persistent) continue;
    std::string error;
    if(!store(*spec, item.value(), error)) {
      console_err("Ignoring invalid setting '{}' in {}: {}", item.key(), path.string(), error);
    }
  }
  return true;
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::trunc);
  if(!(out << get_json(true).dump(2))) {
    console_err("Unable to write {}", path.string());
    return false;
  }
  return true;
}

inline void SettingsManager::apply_environment(const std::string& prefix) {
  for(const auto& spec : setting_specs_) {
    if(!spec.persistent) continue;
    std::string variable = prefix;
    for(unsigned char ch : spec.key) variable += static_cast<char>(std::toupper(ch));
    const char* text = std::getenv(variable.c_str());
    if(!text) continue;
    std::string error;
    auto value = from_text(spec, text, error);
    if(!value || !store(spec, *value, error)) {
      console_err("Ignoring {}: {}", variable, error);
    }
  }
}

inline nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    if(persistent_only && !spec.persistent) continue;
    doc[spec.key] = settings_.at(spec.key);
  }
  return doc;
}

inline bool SettingsManager::within_limits(const SettingSpec& spec,
                                           const nlohmann::json& value,
                                           std::string& error) {
  if(value.is_number_integer()) {
    const auto n = value.get<long long>();
    if(spec.min && n < *spec.min) {
      error = "must be >= " + std::to_string(*spec.min);
    } else if(spec.max && n > *spec.max) {
      error = "must be <= " + std::to_string(*spec.max);
    }
  } else if(value.is_string() && !spec.choices.empty() &&
            std::find(spec.choices.begin(), spec.choices.end(), value.get<std::string>()) == spec.choices.end()) {
    error = "expected one of:";
    for(const auto& choice : spec.choices) error += " " + choice;
  }
  return error.empty();
}

// Brings a JSON value to the stored representation of the setting's type.
inline std::optional<nlohmann::json> SettingsManager::coerce(const SettingSpec& spec,
                                                             const nlohmann::json& value,
                                                             std::string& error) {
  switch(spec.type) {
    case SettingType::Bool:
      if(value.is_boolean()) return value;
      if(value.is_number_integer()) return nlohmann::json(value.get<long long>() != 0);
      error = "expected boolean";
      return std::nullopt;
    case SettingType::Int:
      if(value.is_number_integer()) return value;
      error = "expected integer";
      return std::nullopt;
    case SettingType::Size: {
      std::optional<long long> bytes;
      if(value.is_number_integer()) bytes = value.get<long long>();
      if(value.is_string()) bytes = parse_size(value.get<std::string>());
      if(bytes) return nlohmann::json(*bytes);
      error = "expected a size such as 512K, 4M or 1G";
      return std::nullopt;
    }
    case SettingType::String:
      if(value.is_string()) return value;
      error = "expected string";
      return std::nullopt;
  }
  error = "unsupported type";
  return std::nullopt;
}

// Text from argv or the environment. Sizes stay text so coerce() applies
// the suffix rules.
inline std::optional<nlohmann::json> SettingsManager::from_text(const SettingSpec& spec,
                                                                const std::string& text,
                                                                std::string& error) {
  const std::string clean = trim_copy(text);
  switch(spec.type) {
    case SettingType::Bool: {
      const std::string word = to_lower(clean);
      if(word == "true" || word == "1" || word == "on" || word == "yes") return nlohmann::json(true);
      if(word == "false" || word == "0" || word == "off" || word == "no") return nlohmann::json(false);
      error = "expected boolean (true|false|on|off)";
      return std::nullopt;
    }
    case SettingType::Int: {
      std::size_t consumed = 0;
      try {
        const long long parsed = std::stoll(clean, &consumed);
        if(consumed == clean.size()) return nlohmann::json(parsed);
        error = "trailing characters in integer";
      } catch(const std::exception&) {
        error = "expected integer, got '" + clean + "'";
      }
      return std::nullopt;
    }
    case SettingType::Size:
    case SettingType::String:
      return nlohmann::json(clean);
  }
  error = "unsupported type";
  return std::nullopt;
}

inline bool SettingsManager::store(const SettingSpec& spec, const nlohmann::json& value, std::string& error) {
  error.clear();
  auto coerced = coerce(spec, value, error);
  if(!coerced || !within_limits(spec, *coerced, error)) return false;
  settings_[spec.key] = std::move(*coerced);
  return true;
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  auto parsed = from_text(*spec, value, error);
  return parsed && store(*spec, *parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  return store(*spec, value, error);
}

inline std::string SettingsManager::to_lower(std::string value) {
  for(auto& ch : value) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  const char* blanks = " \t\r\n\f\v";
  const auto first = value.find_first_not_of(blanks);
  if(first == std::string::npos) return std::string();
  return value.substr(first, value.find_last_not_of(blanks) - first + 1);
}

inline std::optional<long long> SettingsManager::parse_size(const std::string& value) {
  std::string digits = to_lower(trim_copy(value));
  long long multiplier = 1;
  if(!digits.empty()) {
    const auto suffix = std::string("kmg").find(digits.back());
    if(suffix != std::string::npos) {
      multiplier = 1LL << (10 * (suffix + 1));
      digits.pop_back();
    }
  }
  if(digits.empty() || digits.size() > 12 ||
     !std::all_of(digits.begin(), digits.end(), [](unsigned char ch){ return std::isdigit(ch); })) {
    return std::nullopt;
  }
  return std::stoll(digits) * multiplier;
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  const auto* spec = find_spec(token);
  return spec ? std::optional<std::string>(spec->key) : std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == SettingType::Bool;
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  auto it = settings_.find(key);
  if(it == settings_.end()) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return it->get<T>();
}
