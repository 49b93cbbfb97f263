#pragma once
#include <cstdint>
#include <string>

namespace pkgstore {

struct Config {
  std::string storage = "db";            // "db" or "fs"
  std::string dbPath = "data/packages.db";
  std::string schemaPath;                // empty: searched, see findSchemaPath()
  std::string fsRoot = "data/packages";
  int64_t     chunkMaxSize = 4 * 1024 * 1024;
  bool        transactionalSave = false;
  int         saveRetries = 0;
  int         port = 8080;
  std::string apiKey;                    // empty = auth disabled
  std::string logLevel = "info";
};

// Defaults, then the JSON file named by PKGSTORE_CONFIG (if set), then
// PKGSTORE_* environment variables. Throws std::runtime_error on bad values.
Config loadConfig();

// Applies the keys present in a JSON config file on top of cfg.
void applyConfigFile(Config& cfg, const std::string& path);
void applyEnvironment(Config& cfg);
void validateConfig(const Config& cfg);

// cfg.schemaPath if set, else schema.sql in the CWD, else src/core/metadata/schema.sql.
std::string findSchemaPath(const Config& cfg);

std::string getEnvOr(const char* key, const std::string& defval);

} // namespace pkgstore
