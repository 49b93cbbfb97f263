#include "ChunkStore.hpp"
#include "ChunkCodec.hpp"
#include "StorageErrors.hpp"
#include "core/db/Database.hpp"

#include <spdlog/spdlog.h>

namespace pkgstore {

int64_t ChunkStore::write(int64_t packageId, std::string_view payload, int64_t maxChunkSize) {
  const auto slices = chunk_codec::split(payload, maxChunkSize);

  auto st = db_.prepare(
    "INSERT INTO package_chunks (package_id, ordinal, size, data) VALUES (?,?,?,?)");
  int64_t ordinal = 0;
  for (const auto& slice : slices) {
    st.bind(1, packageId);
    st.bind(2, ordinal);
    st.bind(3, static_cast<int64_t>(slice.size()));
    st.bindBlob(4, slice);
    st.run();
    st.reset();
    ++ordinal;
  }
  spdlog::debug("package {}: wrote {} chunks ({} bytes)", packageId, ordinal, payload.size());
  return ordinal;
}

std::string ChunkStore::read(int64_t packageId) const {
  auto st = db_.prepare("SELECT data FROM package_chunks WHERE package_id=? ORDER BY ordinal");
  st.bind(1, packageId);

  std::vector<std::string> chunks;
  while (st.step()) chunks.push_back(st.columnBlob(0));
  if (chunks.empty()) {
    throw NotFound("no chunks stored for package " + std::to_string(packageId));
  }
  return chunk_codec::join(chunks);
}

void ChunkStore::remove(int64_t packageId) {
  auto st = db_.prepare("DELETE FROM package_chunks WHERE package_id=?");
  st.bind(1, packageId);
  st.run();
}

std::vector<int64_t> ChunkStore::sizes(int64_t packageId) const {
  auto st = db_.prepare("SELECT size FROM package_chunks WHERE package_id=? ORDER BY ordinal");
  st.bind(1, packageId);
  std::vector<int64_t> out;
  while (st.step()) out.push_back(st.columnInt64(0));
  return out;
}

} // namespace pkgstore
