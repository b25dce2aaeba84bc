#pragma once
#include <optional>
#include <string>
#include <unordered_map>

// Key/value configuration from a dotenv file. Process environment variables take
// precedence over file entries with the same key; empty values count as unset.
class ConfigManager {
public:
  // Replaces any previously loaded file. A missing file is logged, not fatal.
  static void Initialize(const std::string& env_path = ".env");
  static std::optional<std::string> Get(const std::string& key);
  static bool Has(const std::string& key) { return Get(key).has_value(); }
  static std::string GetOrThrow(const std::string& key);
  // Typed getters: absent keys yield the default (or nullopt), present but
  // malformed values throw ConfigError.
  static int GetIntOr(const std::string& key, int default_value);
  static std::optional<unsigned long long> GetUint64(const std::string& key);
  static unsigned long long GetUint64Or(const std::string& key, unsigned long long default_value);
  static bool GetBoolOr(const std::string& key, bool default_value);
  // Overrides a file entry in memory; the environment still wins.
  static void Set(const std::string& key, const std::string& value);
private:
  static std::unordered_map<std::string, std::string> cache_;
  static void LoadEnvFile(const std::string& env_path);
};
