#include "MetadataRegistry.hpp"
#include "core/db/Database.hpp"

namespace pkgstore {

int64_t MetadataRegistry::create(const std::string& filename, int64_t size, const std::string& mimetype) {
  const char* sql = R"SQL(
    INSERT INTO package_meta (filename, size, mimetype)
    VALUES (?,?,?)
  )SQL";
  auto st = db_.prepare(sql);
  int i=1;
  st.bind(i++, filename);
  st.bind(i++, size);
  st.bind(i++, mimetype);
  st.run();
  return db_.lastInsertId();
}

std::optional<PackageMetadata> MetadataRegistry::get(int64_t id) const {
  auto st = db_.prepare("SELECT package_id, filename, size, mimetype FROM package_meta WHERE package_id=?");
  st.bind(1, id);
  if (!st.step()) return std::nullopt;

  PackageMetadata m;
  m.id       = st.columnInt64(0);
  m.filename = st.columnText(1);
  m.size     = st.columnInt64(2);
  m.mimetype = st.columnText(3);
  return m;
}

void MetadataRegistry::remove(int64_t id) {
  auto st = db_.prepare("DELETE FROM package_meta WHERE package_id=?");
  st.bind(1, id);
  st.run();
}

std::vector<int64_t> MetadataRegistry::ids() const {
  auto st = db_.prepare("SELECT package_id FROM package_meta ORDER BY package_id");
  std::vector<int64_t> out;
  while (st.step()) out.push_back(st.columnInt64(0));
  return out;
}

} // namespace pkgstore
