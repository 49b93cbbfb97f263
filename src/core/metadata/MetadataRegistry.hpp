#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/PackageTypes.hpp"

namespace pkgstore {

class Database;

// Rows of package_meta: one per stored package payload.
class MetadataRegistry {
public:
  explicit MetadataRegistry(Database& db) : db_(db) {}

  // Returns the generated package id.
  int64_t create(const std::string& filename, int64_t size, const std::string& mimetype);
  std::optional<PackageMetadata> get(int64_t id) const;
  // Chunks follow through ON DELETE CASCADE. Unknown ids are ignored.
  void remove(int64_t id);
  std::vector<int64_t> ids() const;

private:
  Database& db_;
};

} // namespace pkgstore
