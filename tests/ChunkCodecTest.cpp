#include <gtest/gtest.h>
#include <numeric>

#include "core/storage/ChunkCodec.hpp"
#include "core/storage/StorageErrors.hpp"
#include "TestUtils.hpp"

using namespace pkgstore;

TEST(ChunkCodecTest, SplitProducesCeilDivSlices) {
  const std::string payload = test::makePayload(10);
  auto chunks = chunk_codec::split(payload, 3);
  ASSERT_EQ(chunks.size(), 4u);
  EXPECT_EQ(chunks[0].size(), 3u);
  EXPECT_EQ(chunks[1].size(), 3u);
  EXPECT_EQ(chunks[2].size(), 3u);
  EXPECT_EQ(chunks[3].size(), 1u);
}

TEST(ChunkCodecTest, ExactMultipleHasFullLastChunk) {
  const std::string payload = test::makePayload(4000);
  auto chunks = chunk_codec::split(payload, 1000);
  ASSERT_EQ(chunks.size(), 4u);
  for (const auto& c : chunks) EXPECT_EQ(c.size(), 1000u);
}

TEST(ChunkCodecTest, ChunkSizingHoldsForManyLengths) {
  for (size_t len : {1u, 2u, 7u, 63u, 64u, 65u, 1000u, 4097u}) {
    for (int64_t size : {1, 2, 5, 64, 4096}) {
      const std::string payload = test::makePayload(len, static_cast<uint32_t>(len));
      auto chunks = chunk_codec::split(payload, size);

      ASSERT_EQ(static_cast<int64_t>(chunks.size()), chunk_codec::chunkCount(len, size));
      size_t total = 0;
      for (size_t i = 0; i < chunks.size(); ++i) {
        total += chunks[i].size();
        if (i + 1 < chunks.size()) {
          EXPECT_EQ(chunks[i].size(), static_cast<size_t>(size)) << "len=" << len << " size=" << size;
        } else {
          EXPECT_GT(chunks[i].size(), 0u);
          EXPECT_LE(chunks[i].size(), static_cast<size_t>(size));
        }
      }
      EXPECT_EQ(total, len);
      EXPECT_EQ(chunk_codec::join(chunks), payload) << "len=" << len << " size=" << size;
    }
  }
}

TEST(ChunkCodecTest, ChunkLargerThanPayloadGivesSingleSlice) {
  const std::string payload = "abc";
  auto chunks = chunk_codec::split(payload, 1000000);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0], "abc");
}

TEST(ChunkCodecTest, EmptyPayloadHasNoChunks) {
  auto chunks = chunk_codec::split("", 16);
  EXPECT_TRUE(chunks.empty());
  EXPECT_EQ(chunk_codec::join(chunks), "");
  EXPECT_EQ(chunk_codec::chunkCount(0, 16), 0);
}

TEST(ChunkCodecTest, NonPositiveChunkSizeIsInvalidInput) {
  EXPECT_THROW(chunk_codec::split("data", 0), InvalidInput);
  EXPECT_THROW(chunk_codec::split("data", -4), InvalidInput);
  EXPECT_THROW(chunk_codec::chunkCount(10, 0), InvalidInput);
}

TEST(ChunkCodecTest, JoinKeepsGivenOrder) {
  std::vector<std::string> parts = {"world", "hello "};
  EXPECT_EQ(chunk_codec::join(parts), "worldhello ");
}

TEST(ChunkCodecTest, BinaryBytesSurvive) {
  std::string payload("\0\x01\xff\0\x7f", 5);
  EXPECT_EQ(chunk_codec::join(chunk_codec::split(payload, 2)), payload);
}
