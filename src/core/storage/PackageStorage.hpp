#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/PackageTypes.hpp"

namespace pkgstore {

// Common surface of every package storage medium.
class PackageStorage {
public:
  virtual ~PackageStorage() = default;

  // Replaces the current package for key. Errors are logged and reported as false;
  // after a false return the stored state for key is uncertain.
  virtual bool saveFile(const PackageKey& key,
                        const std::string& version,
                        const std::string& mimetype,
                        std::string_view data,
                        bool retry = false) = 0;
  // true when nothing was stored for key.
  virtual bool deleteFile(const PackageKey& key) = 0;

  virtual std::optional<std::string> getCurrentVersion(const PackageKey& key) = 0;
  virtual std::optional<PackageInfo> getCurrentPackageInfo(const PackageKey& key) = 0;
  virtual std::optional<std::string> readFile(const PackageKey& key) = 0;
  virtual std::vector<PackageInfo>   listPackages() = 0;

  virtual std::string getStorageType() const = 0;
  virtual void reload() = 0;
  virtual void shutdown() = 0;
};

} // namespace pkgstore
