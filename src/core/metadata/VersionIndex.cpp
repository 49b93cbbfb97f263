#include "VersionIndex.hpp"
#include "core/db/Database.hpp"

namespace pkgstore {

void VersionIndex::upsert(const PackageKey& key, int64_t packageId, const std::string& version) {
  const char* sql = R"SQL(
    INSERT INTO package_versions (usage, arch, package_id, version)
    VALUES (?,?,?,?)
    ON CONFLICT(usage, arch) DO UPDATE SET
      package_id=excluded.package_id, version=excluded.version
  )SQL";
  auto st = db_.prepare(sql);
  st.bind(1, static_cast<int>(key.usage));
  st.bind(2, static_cast<int>(key.arch));
  st.bind(3, packageId);
  st.bind(4, version);
  st.run();
}

std::optional<VersionRecord> VersionIndex::lookup(const PackageKey& key) const {
  auto st = db_.prepare("SELECT package_id, version FROM package_versions WHERE usage=? AND arch=?");
  st.bind(1, static_cast<int>(key.usage));
  st.bind(2, static_cast<int>(key.arch));
  if (!st.step()) return std::nullopt;
  return VersionRecord{key, st.columnInt64(0), st.columnText(1)};
}

void VersionIndex::remove(const PackageKey& key) {
  auto st = db_.prepare("DELETE FROM package_versions WHERE usage=? AND arch=?");
  st.bind(1, static_cast<int>(key.usage));
  st.bind(2, static_cast<int>(key.arch));
  st.run();
}

std::vector<VersionRecord> VersionIndex::list() const {
  auto st = db_.prepare("SELECT usage, arch, package_id, version FROM package_versions ORDER BY usage, arch");
  std::vector<VersionRecord> out;
  while (st.step()) {
    PackageKey key{static_cast<PackageUsage>(st.columnInt64(0)), static_cast<PackageArch>(st.columnInt64(1))};
    out.push_back(VersionRecord{key, st.columnInt64(2), st.columnText(3)});
  }
  return out;
}

} // namespace pkgstore
