#pragma once
#include <filesystem>
#include <map>
#include <mutex>
#include <string>

#include "core/storage/PackageStorage.hpp"

namespace pkgstore {

// Packages stored as plain files under root, with versions tracked in
// root/config.json:
//   { "<usage>": { "<arch>": { "version", "filename", "size", "mimetype" } } }
class FsPackageStorage : public PackageStorage {
public:
  explicit FsPackageStorage(std::filesystem::path root);

  bool saveFile(const PackageKey& key,
                const std::string& version,
                const std::string& mimetype,
                std::string_view data,
                bool retry = false) override;
  bool deleteFile(const PackageKey& key) override;

  std::optional<std::string> getCurrentVersion(const PackageKey& key) override;
  std::optional<PackageInfo> getCurrentPackageInfo(const PackageKey& key) override;
  std::optional<std::string> readFile(const PackageKey& key) override;
  std::vector<PackageInfo>   listPackages() override;

  std::string getStorageType() const override { return "fs"; }
  // Re-reads config.json.
  void reload() override;
  // Writes config.json.
  void shutdown() override;

  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path configPath() const { return root_ / "config.json"; }

private:
  void loadCatalogue();
  void saveCatalogue() const;
  std::optional<PackageInfo> resolve(const PackageKey& key);

  std::filesystem::path             root_;
  std::map<PackageKey, PackageInfo> packages_;
  std::recursive_mutex              lock_;
};

} // namespace pkgstore
