#include "core/Config.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using nlohmann::json;

namespace pkgstore {

// ---------- helpers ----------

std::string getEnvOr(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

static int64_t toInt(const std::string& name, const std::string& value) {
  try {
    size_t pos = 0;
    const long long v = std::stoll(value, &pos);
    if (pos != value.size()) throw std::invalid_argument(value);
    return v;
  } catch (const std::exception&) {
    throw std::runtime_error(name + ": not an integer: '" + value + "'");
  }
}

static bool toBool(const std::string& name, std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
  if (value == "0" || value == "false" || value == "no" || value == "off") return false;
  throw std::runtime_error(name + ": not a boolean: '" + value + "'");
}

// ---------- sources ----------

void applyConfigFile(Config& cfg, const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("Cannot open config file: " + path);

  json j;
  try {
    j = json::parse(in);
    cfg.storage           = j.value("storage", cfg.storage);
    cfg.dbPath            = j.value("db_path", cfg.dbPath);
    cfg.schemaPath        = j.value("schema_path", cfg.schemaPath);
    cfg.fsRoot            = j.value("fs_root", cfg.fsRoot);
    cfg.chunkMaxSize      = j.value("chunk_max_size", cfg.chunkMaxSize);
    cfg.transactionalSave = j.value("transactional_save", cfg.transactionalSave);
    cfg.saveRetries       = j.value("save_retries", cfg.saveRetries);
    cfg.port              = j.value("port", cfg.port);
    cfg.apiKey            = j.value("api_key", cfg.apiKey);
    cfg.logLevel          = j.value("log_level", cfg.logLevel);
  } catch (const json::exception& e) {
    throw std::runtime_error("Invalid config file " + path + ": " + e.what());
  }
}

void applyEnvironment(Config& cfg) {
  cfg.storage    = getEnvOr("PKGSTORE_STORAGE", cfg.storage);
  cfg.dbPath     = getEnvOr("PKGSTORE_DB_PATH", cfg.dbPath);
  cfg.schemaPath = getEnvOr("PKGSTORE_SCHEMA_PATH", cfg.schemaPath);
  cfg.fsRoot     = getEnvOr("PKGSTORE_FS_ROOT", cfg.fsRoot);
  cfg.apiKey     = getEnvOr("PKGSTORE_API_KEY", cfg.apiKey);
  cfg.logLevel   = getEnvOr("PKGSTORE_LOG_LEVEL", cfg.logLevel);

  if (const char* v = std::getenv("PKGSTORE_CHUNK_MAX_SIZE"))
    cfg.chunkMaxSize = toInt("PKGSTORE_CHUNK_MAX_SIZE", v);
  if (const char* v = std::getenv("PKGSTORE_TRANSACTIONAL_SAVE"))
    cfg.transactionalSave = toBool("PKGSTORE_TRANSACTIONAL_SAVE", v);
  if (const char* v = std::getenv("PKGSTORE_SAVE_RETRIES"))
    cfg.saveRetries = static_cast<int>(toInt("PKGSTORE_SAVE_RETRIES", v));
  if (const char* v = std::getenv("PKGSTORE_PORT"))
    cfg.port = static_cast<int>(toInt("PKGSTORE_PORT", v));
}

void validateConfig(const Config& cfg) {
  if (cfg.storage != "db" && cfg.storage != "fs")
    throw std::runtime_error("storage must be 'db' or 'fs', got '" + cfg.storage + "'");
  if (cfg.chunkMaxSize <= 0)
    throw std::runtime_error("chunk_max_size must be positive");
  if (cfg.saveRetries < 0)
    throw std::runtime_error("save_retries must not be negative");
  if (cfg.port < 1 || cfg.port > 65535)
    throw std::runtime_error("port out of range: " + std::to_string(cfg.port));
}

Config loadConfig() {
  Config cfg;
  const std::string file = getEnvOr("PKGSTORE_CONFIG", "");
  if (!file.empty()) applyConfigFile(cfg, file);
  applyEnvironment(cfg);
  validateConfig(cfg);
  return cfg;
}

// Look for schema.sql in CWD first (CI copies it there), then fallback.
std::string findSchemaPath(const Config& cfg) {
  namespace fs = std::filesystem;
  if (!cfg.schemaPath.empty()) {
    if (!fs::exists(cfg.schemaPath)) throw std::runtime_error("schema file not found: " + cfg.schemaPath);
    return cfg.schemaPath;
  }
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/metadata/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in CWD and src/core/metadata)");
}

} // namespace pkgstore
