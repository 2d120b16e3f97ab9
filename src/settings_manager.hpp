#pragma once

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "utils.hpp"

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","shared_folder"},     {"aliases", {"folder","f"}},      {"type","string"}, {"default",""},          {"description","Folder served to the network (default ~/Public)"}, {"persistent", true}},
  {{"key","port"},              {"aliases", {"p"}},               {"type","int"},    {"default",8080},        {"description","HTTP/WebDAV port"}, {"persistent", true}},
  {{"key","bind_ip"},           {"aliases", {"bind","b"}},        {"type","string"}, {"default","0.0.0.0"},   {"description","Address the share listens on"}, {"persistent", true}},
  {{"key","auth_enabled"},      {"aliases", {"auth","a"}},        {"type","bool"},   {"default",false},       {"description","Require a username and password for the share"}, {"persistent", true}},
  {{"key","username"},          {"aliases", {"user","u"}},        {"type","string"}, {"default","user"},      {"description","Username for share authentication"}, {"persistent", true}},
  {{"key","password_hash"},     {"aliases", nlohmann::json::array()},{"type","string"}, {"default",""},          {"description","Salted SHA-256 of the share password (salt:hex)"}, {"persistent", true}},
  {{"key","password"},          {"aliases", {"pw"}},              {"type","string"}, {"default",""},          {"description","Share password; stored only as password_hash"}, {"persistent", false}},
  {{"key","app_prefix"},        {"aliases", {"prefix"}},          {"type","string"}, {"default","LanShare"},  {"description","Service name prefix used to recognise peers"}, {"persistent", true}},
  {{"key","host_id"},           {"aliases", {"id","name"}},       {"type","string"}, {"default",""},          {"description","Name advertised to peers (default: host name)"}, {"persistent", true}},
  {{"key","advertise_ip"},      {"aliases", {"ip"}},              {"type","string"}, {"default",""},          {"description","IPv4 address advertised to peers (default: detected)"}, {"persistent", true}},
  {{"key","download_dir"},      {"aliases", {"downloads","d"}},   {"type","string"}, {"default",""},          {"description","Default destination for downloads (default: current directory)"}, {"persistent", true}},
  {{"key","chunk_size"},        {"aliases", {"chunk"}},           {"type","int"},    {"default",1048576},     {"description","Download chunk size in bytes"}, {"persistent", true}},
  {{"key","serve_threads"},     {"aliases", {"threads","t"}},     {"type","int"},    {"default",8},           {"description","Worker threads serving the share"}, {"persistent", true}},
  {{"key","discovery"},         {"aliases", {"mdns"}},            {"type","bool"},   {"default",true},        {"description","Advertise and browse peers with mDNS"}, {"persistent", true}},
  {{"key","transfer_progress"}, {"aliases", {"progress","tp"}},   {"type","bool"},   {"default",true},        {"description","Print progress lines during downloads"}, {"persistent", true}},
  {{"key","log_file"},          {"aliases", {"log"}},             {"type","string"}, {"default",""},          {"description","Also write log lines to this file"}, {"persistent", true}},
  {{"key","verbose"},           {"aliases", {"v"}},               {"type","bool"},   {"default",false},       {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},              {"aliases", {"h","?"}},           {"type","bool"},   {"default",false},       {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},              {"aliases", {"persist"}},         {"type","bool"},   {"default",false},       {"description","Persist current settings to disk"}, {"persistent", false}}
});

// Typed settings backed by a JSON document. The table above declares each
// key with its aliases, type, default and whether it is written to disk.
class SettingsManager {
public:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;   // lower-cased
    std::string type;                   // bool | int | string
    nlohmann::json default_value;
    std::string description;
    bool persistent = true;
  };

  SettingsManager() : SettingsManager(SETTINGS_SPECIFICATION) {}

  explicit SettingsManager(const nlohmann::json& specification) {
    for(const auto& entry : specification) {
      SettingSpec spec;
      spec.key = entry.at("key").get<std::string>();
      for(const auto& alias : entry.value("aliases", nlohmann::json::array())) {
        spec.aliases.push_back(to_lower(alias.get<std::string>()));
      }
      spec.type = entry.at("type").get<std::string>();
      spec.default_value = entry.at("default");
      spec.description = entry.value("description", "");
      spec.persistent = entry.value("persistent", true);
      specs_.push_back(std::move(spec));
    }
    reset();
  }

  void reset() {
    values_ = nlohmann::json::object();
    for(const auto& spec : specs_) values_[spec.key] = spec.default_value;
  }

  template<typename T>
  T get(const std::string& key) const {
    auto it = values_.find(key);
    if(it == values_.end()) throw std::runtime_error("Unknown setting: " + key);
    return it->get<T>();
  }

  bool has(const std::string& key) const { return values_.contains(key); }

  // Accepts a key or an alias, case-insensitively.
  const SettingSpec* find(const std::string& token) const {
    auto lowered = to_lower(trim_copy(token));
    for(const auto& spec : specs_) {
      if(to_lower(spec.key) == lowered) return &spec;
      if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) return &spec;
    }
    return nullptr;
  }

  std::optional<std::string> resolve_key(const std::string& token) const {
    if(const auto* spec = find(token)) return spec->key;
    return std::nullopt;
  }

  bool is_bool_setting(const std::string& token) const {
    const auto* spec = find(token);
    return spec && spec->type == "bool";
  }

  const std::vector<SettingSpec>& specs() const { return specs_; }

  // Parses `text` according to the setting's type; on failure leaves the
  // value untouched and fills `error`.
  bool set_from_string(const std::string& token, const std::string& text, std::string& error) {
    error.clear();
    const auto* spec = find(token);
    if(!spec) {
      error = "unknown setting '" + token + "'";
      return false;
    }
    auto clean = trim_copy(text);
    if(spec->type == "bool") {
      auto parsed = parse_bool(clean);
      if(!parsed) {
        error = "expected true|false|on|off";
        return false;
      }
      values_[spec->key] = *parsed;
      return true;
    }
    if(spec->type == "int") {
      try {
        std::size_t used = 0;
        long long value = std::stoll(clean, &used);
        if(used != clean.size()) throw std::invalid_argument(clean);
        values_[spec->key] = value;
        return true;
      } catch(const std::logic_error&) {
        error = "expected an integer, got '" + clean + "'";
        return false;
      }
    }
    values_[spec->key] = clean;
    return true;
  }

  bool set_value(const std::string& token, const nlohmann::json& value, std::string& error) {
    error.clear();
    const auto* spec = find(token);
    if(!spec) {
      error = "unknown setting '" + token + "'";
      return false;
    }
    bool ok = (spec->type == "bool" && value.is_boolean()) ||
              (spec->type == "int" && value.is_number_integer()) ||
              (spec->type == "string" && value.is_string());
    if(!ok) {
      error = "expected " + spec->type;
      return false;
    }
    values_[spec->key] = value;
    return true;
  }

  std::string value_as_string(const std::string& key) const {
    auto it = values_.find(key);
    if(it == values_.end()) return "<unknown>";
    if(it->is_string()) return it->get<std::string>();
    if(it->is_boolean()) return it->get<bool>() ? "true" : "false";
    return it->dump();
  }

  nlohmann::json to_json(bool persistent_only = true) const {
    nlohmann::json doc = nlohmann::json::object();
    for(const auto& spec : specs_) {
      if(persistent_only && !spec.persistent) continue;
      doc[spec.key] = values_.at(spec.key);
    }
    return doc;
  }

  // Unknown keys are ignored; badly typed ones are reported and skipped.
  void merge_json(const nlohmann::json& doc) {
    if(!doc.is_object()) return;
    for(const auto& item : doc.items()) {
      const auto* spec = find(item.key());
      if(!spec || !spec->persistent) continue;
      std::string error;
      if(!set_value(spec->key, item.value(), error)) {
        print_err(nullptr, "Ignoring setting '{}': {}", item.key(), error);
      }
    }
  }

  void set_settings_path(const std::filesystem::path& path) { settings_path_ = path; }

  // $XDG_CONFIG_HOME/lanshare/settings.json, falling back to ~/.config.
  std::filesystem::path settings_path() const {
    if(!settings_path_.empty()) return settings_path_;
    if(const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
      return std::filesystem::path(xdg) / "lanshare" / "settings.json";
    }
    if(const char* home = std::getenv("HOME"); home && *home) {
      return std::filesystem::path(home) / ".config" / "lanshare" / "settings.json";
    }
    return std::filesystem::current_path() / ".lanshare" / "settings.json";
  }

  bool load() {
    auto path = settings_path();
    std::ifstream in(path);
    if(!in) return false;
    try {
      merge_json(nlohmann::json::parse(in));
      return true;
    } catch(const nlohmann::json::exception& e) {
      print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
      return false;
    }
  }

  bool save() const {
    auto path = settings_path();
    std::error_code ec;
    if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream out(path, std::ios::trunc);
    if(!out) {
      print_err(nullptr, "Unable to write {}", path.string());
      return false;
    }
    out << to_json(true).dump(2) << "\n";
    return static_cast<bool>(out);
  }

  bool save_requested() const { return get<bool>("save"); }
  bool help_requested() const { return get<bool>("help"); }

  static std::optional<bool> parse_bool(const std::string& text) {
    auto v = to_lower(trim_copy(text));
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    return std::nullopt;
  }

private:
  std::vector<SettingSpec> specs_;
  nlohmann::json values_;
  std::filesystem::path settings_path_;
};
