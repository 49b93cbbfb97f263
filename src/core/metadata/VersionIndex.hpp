#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/PackageTypes.hpp"

namespace pkgstore {

class Database;

struct VersionRecord {
  PackageKey  key;
  int64_t     packageId = 0;
  std::string version;
};

// package_versions: at most one current package per (usage, arch).
class VersionIndex {
public:
  explicit VersionIndex(Database& db) : db_(db) {}

  // Replaces the row for key in place if there is one.
  void upsert(const PackageKey& key, int64_t packageId, const std::string& version);
  std::optional<VersionRecord> lookup(const PackageKey& key) const;
  void remove(const PackageKey& key);
  // Ordered by usage, then arch.
  std::vector<VersionRecord> list() const;

private:
  Database& db_;
};

} // namespace pkgstore
