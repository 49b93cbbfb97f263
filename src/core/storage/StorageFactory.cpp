#include "StorageFactory.hpp"
#include "DbPackageStorage.hpp"
#include "FsPackageStorage.hpp"
#include "core/db/Database.hpp"
#include "core/metadata/InitDb.hpp"

#include <spdlog/spdlog.h>
#include <filesystem>
#include <stdexcept>

namespace pkgstore {

std::unique_ptr<PackageStorage> makeStorage(const Config& cfg) {
  if (cfg.storage == "db") {
    const auto parent = std::filesystem::path(cfg.dbPath).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);

    auto db = std::make_shared<Database>(cfg.dbPath);
    initDatabase(*db, findSchemaPath(cfg));

    DbStorageSettings settings;
    settings.chunkMaxSize      = cfg.chunkMaxSize;
    settings.transactionalSave = cfg.transactionalSave;
    settings.saveRetries       = cfg.saveRetries;
    spdlog::info("Using database package storage at {}", cfg.dbPath);
    return std::make_unique<DbPackageStorage>(std::move(db), settings);
  }
  if (cfg.storage == "fs") {
    spdlog::info("Using filesystem package storage at {}", cfg.fsRoot);
    return std::make_unique<FsPackageStorage>(cfg.fsRoot);
  }
  throw std::invalid_argument("unknown package storage '" + cfg.storage + "'");
}

} // namespace pkgstore
