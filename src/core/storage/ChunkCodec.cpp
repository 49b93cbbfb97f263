#include "core/storage/ChunkCodec.hpp"
#include "core/storage/StorageErrors.hpp"

#include <algorithm>

namespace pkgstore {
namespace chunk_codec {

static void checkChunkSize(int64_t chunkSize) {
  if (chunkSize <= 0) {
    throw InvalidInput("chunk size must be positive, got " + std::to_string(chunkSize));
  }
}

int64_t chunkCount(int64_t length, int64_t chunkSize) {
  checkChunkSize(chunkSize);
  if (length <= 0) return 0;
  return (length + chunkSize - 1) / chunkSize;
}

std::vector<std::string_view> split(std::string_view payload, int64_t chunkSize) {
  const int64_t n = chunkCount(static_cast<int64_t>(payload.size()), chunkSize);
  const auto step = static_cast<size_t>(chunkSize);

  std::vector<std::string_view> out;
  out.reserve(static_cast<size_t>(n));
  for (size_t off = 0; off < payload.size(); off += step) {
    out.push_back(payload.substr(off, std::min(step, payload.size() - off)));
  }
  return out;
}

template <typename Seq>
static std::string joinImpl(const Seq& chunks) {
  size_t total = 0;
  for (const auto& c : chunks) total += c.size();
  std::string out;
  out.reserve(total);
  for (const auto& c : chunks) out.append(c.data(), c.size());
  return out;
}

std::string join(const std::vector<std::string>& chunks) { return joinImpl(chunks); }
std::string join(const std::vector<std::string_view>& chunks) { return joinImpl(chunks); }

} // namespace chunk_codec
} // namespace pkgstore
