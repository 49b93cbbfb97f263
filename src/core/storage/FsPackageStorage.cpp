#include "FsPackageStorage.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

using nlohmann::json;

namespace pkgstore {

namespace fs = std::filesystem;

FsPackageStorage::FsPackageStorage(fs::path root) : root_(std::move(root)) {
  spdlog::debug("Initializing filesystem package storage at {}", root_.string());
  fs::create_directories(root_);
  loadCatalogue();
}

// -------- catalogue --------

void FsPackageStorage::loadCatalogue() {
  std::lock_guard<std::recursive_mutex> guard(lock_);
  packages_.clear();

  std::ifstream in(configPath());
  if (!in) {
    spdlog::debug("No package catalogue at {}, starting empty", configPath().string());
    return;
  }

  json j;
  try {
    j = json::parse(in);
  } catch (const json::exception& e) {
    throw std::runtime_error("invalid package catalogue " + configPath().string() + ": " + e.what());
  }
  if (!j.is_object()) {
    throw std::runtime_error("invalid package catalogue " + configPath().string() + ": not an object");
  }

  for (const auto& [usageName, arches] : j.items()) {
    auto usage = parseUsage(usageName);
    if (!usage || !arches.is_object()) {
      spdlog::warn("Ignoring unknown package usage '{}' in catalogue", usageName);
      continue;
    }
    for (const auto& [archName, entry] : arches.items()) {
      auto arch = parseArch(archName);
      if (!arch) {
        spdlog::warn("Ignoring unknown architecture '{}' in catalogue", archName);
        continue;
      }
      PackageInfo info;
      info.key = PackageKey{*usage, *arch};
      try {
        info.version       = entry.at("version").get<std::string>();
        info.meta.filename = entry.at("filename").get<std::string>();
        info.meta.size     = entry.at("size").get<int64_t>();
        info.meta.mimetype = entry.value("mimetype", std::string("application/octet-stream"));
      } catch (const json::exception& e) {
        spdlog::warn("Ignoring malformed catalogue entry {}: {}", to_string(info.key), e.what());
        continue;
      }
      packages_[info.key] = info;
    }
  }
  spdlog::info("Loaded {} packages from {}", packages_.size(), configPath().string());
}

void FsPackageStorage::saveCatalogue() const {
  json j = json::object();
  for (const auto& [key, info] : packages_) {
    j[to_string(key.usage)][to_string(key.arch)] = {
      {"version",  info.version},
      {"filename", info.meta.filename},
      {"size",     info.meta.size},
      {"mimetype", info.meta.mimetype}
    };
  }

  // write-then-rename so a crash never leaves a truncated catalogue
  const fs::path tmp = configPath().string() + ".tmp";
  {
    std::ofstream os(tmp, std::ios::trunc);
    if (!os) throw std::runtime_error("cannot write " + tmp.string());
    os << j.dump(2);
    os.flush();
    if (!os) throw std::runtime_error("cannot write " + tmp.string());
  }
  fs::rename(tmp, configPath());
}

// -------- writers --------

bool FsPackageStorage::saveFile(const PackageKey& key,
                                const std::string& version,
                                const std::string& mimetype,
                                std::string_view data,
                                bool /*retry*/) {
  std::lock_guard<std::recursive_mutex> guard(lock_);
  try {
    deleteFile(key);
  } catch (const std::exception& e) {
    spdlog::warn("Could not remove previous package for {}: {}", to_string(key), e.what());
  }

  try {
    const std::string filename = generateFilename(key, version, mimetype);
    const fs::path file = root_ / filename;
    std::ofstream os(file, std::ios::binary | std::ios::trunc);
    if (!os) throw std::runtime_error("cannot open " + file.string());
    os.write(data.data(), static_cast<std::streamsize>(data.size()));
    os.flush();
    if (!os) throw std::runtime_error("short write to " + file.string());

    PackageInfo info;
    info.key = key;
    info.version = version;
    info.meta = PackageMetadata{0, filename, static_cast<int64_t>(data.size()), mimetype};
    packages_[key] = info;
    saveCatalogue();
    spdlog::info("Stored {} ({} bytes) at {}", filename, data.size(), file.string());
    return true;
  } catch (const std::exception& e) {
    spdlog::critical("Unable to save package {}: {}", to_string(key), e.what());
  }
  return false;
}

bool FsPackageStorage::deleteFile(const PackageKey& key) {
  std::lock_guard<std::recursive_mutex> guard(lock_);
  auto it = packages_.find(key);
  if (it == packages_.end()) return true;

  fs::remove(root_ / it->second.meta.filename);
  spdlog::info("Removed {} version {}", to_string(key), it->second.version);
  packages_.erase(it);
  saveCatalogue();
  return true;
}

void FsPackageStorage::reload() {
  loadCatalogue();
}

void FsPackageStorage::shutdown() {
  std::lock_guard<std::recursive_mutex> guard(lock_);
  saveCatalogue();
}

// -------- readers --------

std::optional<std::string> FsPackageStorage::getCurrentVersion(const PackageKey& key) {
  std::lock_guard<std::recursive_mutex> guard(lock_);
  auto it = packages_.find(key);
  if (it == packages_.end()) return std::nullopt;
  return it->second.version;
}

std::optional<PackageInfo> FsPackageStorage::getCurrentPackageInfo(const PackageKey& key) {
  return resolve(key);
}

std::optional<std::string> FsPackageStorage::readFile(const PackageKey& key) {
  std::lock_guard<std::recursive_mutex> guard(lock_);
  auto info = resolve(key);
  if (!info) return std::nullopt;

  std::ifstream in(root_ / info->meta.filename, std::ios::binary);
  if (!in) return std::nullopt;
  std::ostringstream buf; buf << in.rdbuf();
  return buf.str();
}

std::vector<PackageInfo> FsPackageStorage::listPackages() {
  std::lock_guard<std::recursive_mutex> guard(lock_);
  std::vector<PackageKey> keys;
  for (const auto& entry : packages_) keys.push_back(entry.first);

  std::vector<PackageInfo> out;
  for (const auto& key : keys) {
    if (auto info = resolve(key)) out.push_back(*info);
  }
  return out;
}

// Entries whose file vanished from disk are dropped from the catalogue.
std::optional<PackageInfo> FsPackageStorage::resolve(const PackageKey& key) {
  std::lock_guard<std::recursive_mutex> guard(lock_);
  auto it = packages_.find(key);
  if (it == packages_.end()) return std::nullopt;

  if (!fs::exists(root_ / it->second.meta.filename)) {
    spdlog::warn("{} is missing on disk, removing version {}", it->second.meta.filename, it->second.version);
    packages_.erase(it);
    saveCatalogue();
    return std::nullopt;
  }
  return it->second;
}

} // namespace pkgstore
