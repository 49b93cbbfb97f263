#pragma once
#include <cstdint>
#include <memory>
#include <mutex>

#include "core/metadata/MetadataRegistry.hpp"
#include "core/metadata/VersionIndex.hpp"
#include "core/storage/ChunkStore.hpp"
#include "core/storage/PackageStorage.hpp"
#include "core/storage/StorageErrors.hpp"

namespace pkgstore {

class Database;

struct DbStorageSettings {
  int64_t chunkMaxSize = 4 * 1024 * 1024;
  // Run the whole save in one transaction so a failed save keeps the old package.
  bool    transactionalSave = false;
  // Extra attempts made when saveFile is called with retry=true.
  int     saveRetries = 0;
};

// Packages stored as chunked blobs in the package database.
//
// Writers (save, delete, purge, pruning of dangling versions) are serialized on
// one re-entrant lock; readers are not, and can see a key whose old package
// has been deleted while the new one is still being written.
class DbPackageStorage : public PackageStorage {
public:
  DbPackageStorage(std::shared_ptr<Database> db, DbStorageSettings settings = {});

  bool saveFile(const PackageKey& key,
                const std::string& version,
                const std::string& mimetype,
                std::string_view data,
                bool retry = false) override;
  // saveFile with the failure kind kept.
  SaveResult trySave(const PackageKey& key,
                     const std::string& version,
                     const std::string& mimetype,
                     std::string_view data,
                     bool retry = false);

  // Backend errors propagate as StorageBackendError.
  bool deleteFile(const PackageKey& key) override;

  std::optional<std::string> getCurrentVersion(const PackageKey& key) override;
  std::optional<PackageInfo> getCurrentPackageInfo(const PackageKey& key) override;
  std::optional<std::string> readFile(const PackageKey& key) override;
  std::vector<PackageInfo>   listPackages() override;

  // Removes packages no version points at. Returns how many were removed.
  int purgeOrphans();

  std::string getStorageType() const override { return "db"; }
  void reload() override {}
  void shutdown() override {}

private:
  SaveResult saveOnce(const PackageKey& key,
                      const std::string& version,
                      const std::string& mimetype,
                      std::string_view data);
  void writePackage(const PackageKey& key,
                    const std::string& version,
                    const std::string& mimetype,
                    std::string_view data);
  std::optional<PackageInfo> resolve(const PackageKey& key);
  void pruneDangling(const VersionRecord& rec);

  std::shared_ptr<Database> db_;
  DbStorageSettings         settings_;
  MetadataRegistry          meta_;
  VersionIndex              versions_;
  ChunkStore                chunks_;
  std::recursive_mutex      lock_;
};

} // namespace pkgstore
