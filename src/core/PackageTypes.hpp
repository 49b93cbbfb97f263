#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pkgstore {

// What a package is used for. Values are persisted, do not renumber.
enum class PackageUsage : int {
  Core = 1,
  Controller = 2,
  Companion = 3,
};

enum class PackageArch : int {
  NoArch = 0,
  ArmeabiV7a = 1,
  Arm64V8a = 2,
};

struct PackageKey {
  PackageUsage usage;
  PackageArch arch;

  bool operator==(const PackageKey& o) const { return usage == o.usage && arch == o.arch; }
  bool operator!=(const PackageKey& o) const { return !(*this == o); }
  bool operator<(const PackageKey& o) const {
    if (usage != o.usage) return usage < o.usage;
    return arch < o.arch;
  }
};

struct PackageMetadata {
  int64_t     id = 0;
  std::string filename;
  int64_t     size = 0;
  std::string mimetype;
};

// Metadata of the current package for a key, together with its version.
struct PackageInfo {
  PackageKey      key;
  PackageMetadata meta;
  std::string     version;
};

constexpr const char* kApkMimetype = "application/vnd.android.package-archive";
constexpr const char* kZipMimetype = "application/zip";

std::string to_string(PackageUsage usage);
std::string to_string(PackageArch arch);
std::string to_string(const PackageKey& key);

// Accepts the name (case-insensitive) or the numeric value.
std::optional<PackageUsage> parseUsage(std::string_view text);
std::optional<PackageArch>  parseArch(std::string_view text);

// <usage>_<arch>_<version><ext>, safe to use as a file name.
std::string generateFilename(const PackageKey& key,
                             const std::string& version,
                             const std::string& mimetype);

} // namespace pkgstore
