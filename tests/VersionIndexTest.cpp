#include <gtest/gtest.h>

#include "core/metadata/VersionIndex.hpp"
#include "TestUtils.hpp"

using namespace pkgstore;

class VersionIndexTest : public ::testing::Test {
protected:
  void SetUp() override {
    db = test::makeTestDatabase();
    index = std::make_unique<VersionIndex>(*db);
  }

  std::shared_ptr<Database> db;
  std::unique_ptr<VersionIndex> index;
  const PackageKey coreArm64{PackageUsage::Core, PackageArch::Arm64V8a};
  const PackageKey coreArmv7{PackageUsage::Core, PackageArch::ArmeabiV7a};
};

TEST_F(VersionIndexTest, LookupOfEmptyKey) {
  EXPECT_FALSE(index->lookup(coreArm64).has_value());
}

TEST_F(VersionIndexTest, UpsertInsertsThenReplacesInPlace) {
  index->upsert(coreArm64, 1, "1.0");
  index->upsert(coreArm64, 2, "2.0");

  EXPECT_EQ(test::countRows(*db, "package_versions"), 1);
  auto rec = index->lookup(coreArm64);
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->packageId, 2);
  EXPECT_EQ(rec->version, "2.0");
  EXPECT_EQ(rec->key, coreArm64);
}

TEST_F(VersionIndexTest, KeysAreIndependent) {
  index->upsert(coreArm64, 1, "1.0");
  index->upsert(coreArmv7, 2, "1.1");
  EXPECT_EQ(index->lookup(coreArm64)->version, "1.0");
  EXPECT_EQ(index->lookup(coreArmv7)->version, "1.1");

  index->remove(coreArm64);
  EXPECT_FALSE(index->lookup(coreArm64).has_value());
  EXPECT_TRUE(index->lookup(coreArmv7).has_value());
}

TEST_F(VersionIndexTest, RemoveIsIdempotent) {
  EXPECT_NO_THROW(index->remove(coreArm64));
  index->upsert(coreArm64, 1, "1.0");
  index->remove(coreArm64);
  EXPECT_NO_THROW(index->remove(coreArm64));
  EXPECT_EQ(test::countRows(*db, "package_versions"), 0);
}

TEST_F(VersionIndexTest, ListIsOrderedByUsageThenArch) {
  const PackageKey companion{PackageUsage::Companion, PackageArch::NoArch};
  index->upsert(companion, 3, "c");
  index->upsert(coreArm64, 1, "a");
  index->upsert(coreArmv7, 2, "b");

  auto all = index->list();
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].key, coreArmv7);
  EXPECT_EQ(all[1].key, coreArm64);
  EXPECT_EQ(all[2].key, companion);
}
