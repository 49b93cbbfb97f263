#include <gtest/gtest.h>

#include "core/db/Database.hpp"
#include "core/storage/StorageErrors.hpp"
#include "TestUtils.hpp"

using namespace pkgstore;

class DatabaseTest : public ::testing::Test {
protected:
  void SetUp() override {
    db = test::makeTestDatabase();
  }

  std::shared_ptr<Database> db;
};

TEST_F(DatabaseTest, SchemaCreatesTables) {
  EXPECT_EQ(test::countRows(*db, "package_meta"), 0);
  EXPECT_EQ(test::countRows(*db, "package_chunks"), 0);
  EXPECT_EQ(test::countRows(*db, "package_versions"), 0);
}

TEST_F(DatabaseTest, SchemaCanBeAppliedTwice) {
  EXPECT_NO_THROW(initDatabase(*db, PKGSTORE_TEST_SCHEMA));
}

TEST_F(DatabaseTest, MissingSchemaFileThrows) {
  EXPECT_THROW(initDatabase(*db, "/nonexistent/schema.sql"), std::runtime_error);
}

TEST_F(DatabaseTest, BadSqlIsBackendError) {
  EXPECT_THROW(db->exec("SELEC nonsense"), StorageBackendError);
  EXPECT_THROW(db->prepare("SELECT * FROM no_such_table"), StorageBackendError);
}

TEST_F(DatabaseTest, ConstraintViolationIsBackendError) {
  db->exec("INSERT INTO package_versions (usage, arch, package_id, version) VALUES (1, 2, 7, '1.0')");
  auto st = db->prepare("INSERT INTO package_versions (usage, arch, package_id, version) VALUES (1, 2, 8, '2.0')");
  EXPECT_THROW(st.run(), StorageBackendError);
}

TEST_F(DatabaseTest, BlobsKeepEmbeddedNulsAndEmptyIsNotNull) {
  db->exec("CREATE TABLE blobs (id INTEGER PRIMARY KEY, data BLOB NOT NULL)");
  const std::string bytes("a\0b\0c", 5);

  auto ins = db->prepare("INSERT INTO blobs (data) VALUES (?)");
  ins.bindBlob(1, bytes);
  ins.run();
  const int64_t first = db->lastInsertId();
  ins.reset();
  ins.bindBlob(1, std::string_view());
  ins.run();

  auto sel = db->prepare("SELECT data FROM blobs ORDER BY id");
  ASSERT_TRUE(sel.step());
  EXPECT_EQ(sel.columnBlob(0), bytes);
  ASSERT_TRUE(sel.step());
  EXPECT_FALSE(sel.columnIsNull(0));
  EXPECT_EQ(sel.columnBlob(0), "");
  EXPECT_FALSE(sel.step());
  EXPECT_EQ(first, 1);
}

TEST_F(DatabaseTest, TransactionRollsBackWithoutCommit) {
  {
    Transaction tx(*db);
    db->exec("INSERT INTO package_meta (filename, size, mimetype) VALUES ('a', 1, 'x')");
    EXPECT_EQ(test::countRows(*db, "package_meta"), 1);
  }
  EXPECT_EQ(test::countRows(*db, "package_meta"), 0);
}

TEST_F(DatabaseTest, TransactionCommits) {
  {
    Transaction tx(*db);
    db->exec("INSERT INTO package_meta (filename, size, mimetype) VALUES ('a', 1, 'x')");
    tx.commit();
  }
  EXPECT_EQ(test::countRows(*db, "package_meta"), 1);
}

TEST_F(DatabaseTest, DeletingMetadataCascadesToChunks) {
  db->exec("INSERT INTO package_meta (filename, size, mimetype) VALUES ('a', 2, 'x')");
  const int64_t id = db->lastInsertId();
  db->exec("INSERT INTO package_chunks (package_id, ordinal, size, data) VALUES (" +
           std::to_string(id) + ", 0, 2, x'0102')");
  EXPECT_EQ(test::countRows(*db, "package_chunks"), 1);

  db->exec("DELETE FROM package_meta WHERE package_id=" + std::to_string(id));
  EXPECT_EQ(test::countRows(*db, "package_chunks"), 0);
}

TEST(DatabaseOpenTest, UnopenablePathIsBackendError) {
  EXPECT_THROW(Database("/nonexistent-dir/for/sure/db.sqlite"), StorageBackendError);
}
