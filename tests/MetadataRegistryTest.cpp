#include <gtest/gtest.h>

#include "core/metadata/MetadataRegistry.hpp"
#include "TestUtils.hpp"

using namespace pkgstore;

class MetadataRegistryTest : public ::testing::Test {
protected:
  void SetUp() override {
    db = test::makeTestDatabase();
    registry = std::make_unique<MetadataRegistry>(*db);
  }

  std::shared_ptr<Database> db;
  std::unique_ptr<MetadataRegistry> registry;
};

TEST_F(MetadataRegistryTest, CreateAssignsFreshIds) {
  const int64_t a = registry->create("a.apk", 10, kApkMimetype);
  const int64_t b = registry->create("b.apk", 20, kApkMimetype);
  EXPECT_NE(a, b);

  auto meta = registry->get(b);
  ASSERT_TRUE(meta.has_value());
  EXPECT_EQ(meta->id, b);
  EXPECT_EQ(meta->filename, "b.apk");
  EXPECT_EQ(meta->size, 20);
  EXPECT_EQ(meta->mimetype, kApkMimetype);
}

TEST_F(MetadataRegistryTest, IdsAreNotReusedAfterRemove) {
  const int64_t a = registry->create("a.apk", 1, kApkMimetype);
  registry->remove(a);
  const int64_t b = registry->create("a.apk", 1, kApkMimetype);
  EXPECT_GT(b, a);
}

TEST_F(MetadataRegistryTest, GetUnknownIsEmpty) {
  EXPECT_FALSE(registry->get(4242).has_value());
}

TEST_F(MetadataRegistryTest, RemoveIsIdempotent) {
  const int64_t id = registry->create("a.apk", 1, kApkMimetype);
  registry->remove(id);
  EXPECT_NO_THROW(registry->remove(id));
  EXPECT_NO_THROW(registry->remove(999));
  EXPECT_FALSE(registry->get(id).has_value());
  EXPECT_TRUE(registry->ids().empty());
}

TEST_F(MetadataRegistryTest, IdsListsEverything) {
  const int64_t a = registry->create("a", 1, "x");
  const int64_t b = registry->create("b", 1, "x");
  EXPECT_EQ(registry->ids(), (std::vector<int64_t>{a, b}));
}
