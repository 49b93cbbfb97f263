#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pkgstore {

class Database;

// package_chunks: payload slices keyed by package id and ordinal.
class ChunkStore {
public:
  explicit ChunkStore(Database& db) : db_(db) {}

  // Returns the number of chunks written.
  int64_t write(int64_t packageId, std::string_view payload, int64_t maxChunkSize);
  // Joins the chunks in ordinal order. Throws NotFound if there are none.
  std::string read(int64_t packageId) const;
  void remove(int64_t packageId);

  std::vector<int64_t> sizes(int64_t packageId) const;

private:
  Database& db_;
};

} // namespace pkgstore
