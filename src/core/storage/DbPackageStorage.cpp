#include "DbPackageStorage.hpp"
#include "core/db/Database.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>

namespace pkgstore {

DbPackageStorage::DbPackageStorage(std::shared_ptr<Database> db, DbStorageSettings settings)
  : db_(std::move(db)),
    settings_(settings),
    meta_(*db_),
    versions_(*db_),
    chunks_(*db_) {
  spdlog::debug("Initializing database package storage (chunk size {})", settings_.chunkMaxSize);
}

// -------- writers --------

bool DbPackageStorage::saveFile(const PackageKey& key,
                                const std::string& version,
                                const std::string& mimetype,
                                std::string_view data,
                                bool retry) {
  return trySave(key, version, mimetype, data, retry).ok();
}

SaveResult DbPackageStorage::trySave(const PackageKey& key,
                                     const std::string& version,
                                     const std::string& mimetype,
                                     std::string_view data,
                                     bool retry) {
  std::lock_guard<std::recursive_mutex> guard(lock_);

  const int attempts = retry ? 1 + std::max(0, settings_.saveRetries) : 1;
  SaveResult result;
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    result = saveOnce(key, version, mimetype, data);
    if (result.ok()) break;
    if (attempt < attempts) {
      spdlog::warn("Retrying upload of {} ({}/{})", to_string(key), attempt, attempts - 1);
    }
  }
  return result;
}

SaveResult DbPackageStorage::saveOnce(const PackageKey& key,
                                      const std::string& version,
                                      const std::string& mimetype,
                                      std::string_view data) {
  try {
    if (settings_.transactionalSave) {
      Transaction tx(*db_);
      writePackage(key, version, mimetype, data);
      tx.commit();
    } else {
      writePackage(key, version, mimetype, data);
    }
    return SaveResult::success();
  } catch (const InvalidInput& e) {
    spdlog::critical("Unable to upload package {}: {}", to_string(key), e.what());
    return SaveResult::failure(SaveErrorKind::InvalidInput, e.what());
  } catch (const StorageBackendError& e) {
    spdlog::critical("Unable to upload package {}: {}", to_string(key), e.what());
    return SaveResult::failure(SaveErrorKind::StorageBackend, e.what());
  } catch (const NotFound& e) {
    spdlog::critical("Unable to upload package {}: {}", to_string(key), e.what());
    return SaveResult::failure(SaveErrorKind::NotFound, e.what());
  } catch (const std::exception& e) {
    spdlog::critical("Unable to upload package {}: {}", to_string(key), e.what());
    return SaveResult::failure(SaveErrorKind::Unknown, e.what());
  }
}

// Old package goes first, then metadata, version row and chunks of the new one.
void DbPackageStorage::writePackage(const PackageKey& key,
                                    const std::string& version,
                                    const std::string& mimetype,
                                    std::string_view data) {
  try {
    deleteFile(key);
  } catch (const StorageError& e) {
    spdlog::warn("Could not remove previous package for {}: {}", to_string(key), e.what());
  }

  const std::string filename = generateFilename(key, version, mimetype);
  const int64_t id = meta_.create(filename, static_cast<int64_t>(data.size()), mimetype);
  versions_.upsert(key, id, version);

  spdlog::info("Starting upload of {} ({}, {} bytes)", filename, to_string(key), data.size());
  const int64_t n = chunks_.write(id, data, settings_.chunkMaxSize);
  spdlog::info("Finished upload of {} in {} chunks", filename, n);
}

bool DbPackageStorage::deleteFile(const PackageKey& key) {
  std::lock_guard<std::recursive_mutex> guard(lock_);

  auto rec = versions_.lookup(key);
  if (!rec) {
    spdlog::debug("Nothing stored for {}", to_string(key));
    return true;
  }
  chunks_.remove(rec->packageId);
  meta_.remove(rec->packageId);
  versions_.remove(key);
  spdlog::info("Removed {} version {}", to_string(key), rec->version);
  return true;
}

int DbPackageStorage::purgeOrphans() {
  std::lock_guard<std::recursive_mutex> guard(lock_);

  std::set<int64_t> referenced;
  for (const auto& rec : versions_.list()) referenced.insert(rec.packageId);

  int removed = 0;
  for (int64_t id : meta_.ids()) {
    if (referenced.count(id)) continue;
    chunks_.remove(id);
    meta_.remove(id);
    ++removed;
  }
  if (removed > 0) spdlog::info("Purged {} orphaned packages", removed);
  return removed;
}

// -------- readers --------

std::optional<std::string> DbPackageStorage::getCurrentVersion(const PackageKey& key) {
  auto rec = versions_.lookup(key);
  if (!rec) return std::nullopt;
  return rec->version;
}

std::optional<PackageInfo> DbPackageStorage::getCurrentPackageInfo(const PackageKey& key) {
  return resolve(key);
}

std::optional<std::string> DbPackageStorage::readFile(const PackageKey& key) {
  auto info = resolve(key);
  if (!info) return std::nullopt;
  if (info->meta.size == 0) return std::string();

  std::string data;
  try {
    data = chunks_.read(info->meta.id);
  } catch (const NotFound&) {
    spdlog::warn("{} version {} has no chunks", to_string(key), info->version);
    return std::nullopt;
  }
  if (static_cast<int64_t>(data.size()) != info->meta.size) {
    spdlog::warn("{} version {} is incomplete ({} of {} bytes)",
                 to_string(key), info->version, data.size(), info->meta.size);
    return std::nullopt;
  }
  return data;
}

std::vector<PackageInfo> DbPackageStorage::listPackages() {
  std::vector<PackageInfo> out;
  for (const auto& rec : versions_.list()) {
    auto meta = meta_.get(rec.packageId);
    if (!meta) {
      pruneDangling(rec);
      continue;
    }
    out.push_back(PackageInfo{rec.key, *meta, rec.version});
  }
  return out;
}

std::optional<PackageInfo> DbPackageStorage::resolve(const PackageKey& key) {
  auto rec = versions_.lookup(key);
  if (!rec) return std::nullopt;
  auto meta = meta_.get(rec->packageId);
  if (!meta) {
    pruneDangling(*rec);
    return std::nullopt;
  }
  return PackageInfo{key, *meta, rec->version};
}

// Drops a version row whose package is gone, unless a writer replaced it meanwhile.
void DbPackageStorage::pruneDangling(const VersionRecord& rec) {
  std::lock_guard<std::recursive_mutex> guard(lock_);
  auto current = versions_.lookup(rec.key);
  if (!current || current->packageId != rec.packageId) return;
  if (meta_.get(rec.packageId)) return;

  spdlog::warn("{} points at missing package {}, removing version {}",
               to_string(rec.key), rec.packageId, rec.version);
  versions_.remove(rec.key);
}

} // namespace pkgstore
