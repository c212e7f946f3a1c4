#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Each entry: key, aliases, type (bool|int|string|json), default,
// description, persistent, and optional inclusive "min"/"max" for ints.
inline const nlohmann::json ROOM_SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","room"},               {"aliases", {"r"}},                  {"type","string"}, {"default",""},         {"description","Room identifier to join"}, {"persistent", true}},
  {{"key","name"},               {"aliases", {"n","display_name"}},   {"type","string"}, {"default",""},         {"description","Display name shown to other participants"}, {"persistent", true}},
  {{"key","peer_id"},            {"aliases", {"id"}},                 {"type","string"}, {"default",""},         {"description","Explicit peer token (random when empty)"}, {"persistent", true}},
  {{"key","listen_ip"},          {"aliases", {"li"}},                 {"type","string"}, {"default","127.0.0.1"},{"description","Interface/IP to accept peer channels on"}, {"persistent", true}},
  {{"key","listen_port"},        {"aliases", {"lp"}},                 {"type","int"},    {"default",0},          {"description","TCP port for peer channels (0 = ephemeral)"}, {"persistent", true}, {"min",0}, {"max",65535}},
  {{"key","advertise_host"},     {"aliases", {"ah"}},                 {"type","string"}, {"default",""},         {"description","Host embedded in the peer id (defaults to listen_ip)"}, {"persistent", true}},
  {{"key","discovery_url"},      {"aliases", {"du","registry"}},      {"type","string"}, {"default","http://127.0.0.1:8080"}, {"description","Base URL of the room registry"}, {"persistent", true}},
  {{"key","download_dir"},       {"aliases", {"dd"}},                 {"type","string"}, {"default","downloads"},{"description","Directory completed files are saved into"}, {"persistent", true}},
  {{"key","chunk_size"},         {"aliases", {"cs"}},                 {"type","int"},    {"default",65536},      {"description","Bytes per chunk message"}, {"persistent", true}, {"min",1024}, {"max",262144}},
  {{"key","connect_timeout_ms"}, {"aliases", {"cto"}},                {"type","int"},    {"default",10000},      {"description","Milliseconds a peer channel may take to open"}, {"persistent", true}, {"min",100}, {"max",600000}},
  {{"key","send_queue_limit"},   {"aliases", {"sql"}},                {"type","int"},    {"default",1048576},    {"description","Queued bytes per channel before chunk production pauses"}, {"persistent", true}, {"min",65536}, {"max",268435456}},
  {{"key","signaling_retry_ms"}, {"aliases", {"srm"}},                {"type","int"},    {"default",3000},       {"description","Delay between attempts to restore the signaling session"}, {"persistent", true}, {"min",100}, {"max",600000}},
  {{"key","auto_join"},          {"aliases", {"aj"}},                 {"type","bool"},   {"default",true},       {"description","Join the room as soon as the node starts"}, {"persistent", true}},
  {{"key","transfer_debug"},     {"aliases", {"transfer","td"}},      {"type","bool"},   {"default",false},      {"description","Log chunk send/receive activity"}, {"persistent", true}},
  {{"key","verbose"},            {"aliases", {"v"}},                  {"type","bool"},   {"default",false},      {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","log_file"},           {"aliases", {"lf"}},                 {"type","string"}, {"default",""},         {"description","Also write log output to this file"}, {"persistent", true}},
  {{"key","help"},               {"aliases", {"h","?"}},              {"type","bool"},   {"default",false},      {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},               {"aliases", {"persist"}},            {"type","bool"},   {"default",false},      {"description","Persist current settings to disk"}, {"persistent", false}}
});

inline const nlohmann::json REGISTRY_SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","listen_port"},            {"aliases", {"lp"}},  {"type","int"},    {"default",8080},      {"description","HTTP port to listen on"}, {"persistent", true}, {"min",0}, {"max",65535}},
  {{"key","listen_ip"},              {"aliases", {"li"}},  {"type","string"}, {"default","0.0.0.0"}, {"description","Interface/IP to bind"}, {"persistent", true}},
  {{"key","ttl_seconds"},            {"aliases", {"ttl"}}, {"type","int"},    {"default",3600},      {"description","Seconds before an untouched entry is pruned"}, {"persistent", true}, {"min",1}, {"max",604800}},
  {{"key","sweep_interval_seconds"}, {"aliases", {"si"}},  {"type","int"},    {"default",300},       {"description","Seconds between sweeps of every room"}, {"persistent", true}, {"min",1}, {"max",86400}},
  {{"key","verbose"},                {"aliases", {"v"}},   {"type","bool"},   {"default",false},     {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","log_file"},               {"aliases", {"lf"}},  {"type","string"}, {"default",""},        {"description","Also write log output to this file"}, {"persistent", true}},
  {{"key","help"},                   {"aliases", {"h","?"}}, {"type","bool"}, {"default",false},     {"description","Show command help and exit"}, {"persistent", false}}
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
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  const nlohmann::json& specification() const { return specification_; }

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json get_json(bool persistent_only = true) const;
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
    std::optional<long long> min;
    std::optional<long long> max;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);
  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json specification_;
  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
  std::filesystem::path settings_path_override_;
};

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
