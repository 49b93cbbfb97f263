#include "core/PackageTypes.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace pkgstore {

static std::string lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

static std::optional<int> parseInt(std::string_view s) {
  int v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

std::string to_string(PackageUsage usage) {
  switch (usage) {
    case PackageUsage::Core:       return "core";
    case PackageUsage::Controller: return "controller";
    case PackageUsage::Companion:  return "companion";
  }
  return "unknown";
}

std::string to_string(PackageArch arch) {
  switch (arch) {
    case PackageArch::NoArch:     return "noarch";
    case PackageArch::ArmeabiV7a: return "armeabi-v7a";
    case PackageArch::Arm64V8a:   return "arm64-v8a";
  }
  return "unknown";
}

std::string to_string(const PackageKey& key) {
  return to_string(key.usage) + "/" + to_string(key.arch);
}

std::optional<PackageUsage> parseUsage(std::string_view text) {
  const std::string s = lower(text);
  if (s == "core")       return PackageUsage::Core;
  if (s == "controller") return PackageUsage::Controller;
  if (s == "companion")  return PackageUsage::Companion;
  if (auto n = parseInt(s)) {
    if (*n >= 1 && *n <= 3) return static_cast<PackageUsage>(*n);
  }
  return std::nullopt;
}

std::optional<PackageArch> parseArch(std::string_view text) {
  const std::string s = lower(text);
  if (s == "noarch") return PackageArch::NoArch;
  if (s == "armeabi-v7a" || s == "armeabi_v7a" || s == "armv7") return PackageArch::ArmeabiV7a;
  if (s == "arm64-v8a" || s == "arm64_v8a" || s == "arm64")     return PackageArch::Arm64V8a;
  if (auto n = parseInt(s)) {
    if (*n >= 0 && *n <= 2) return static_cast<PackageArch>(*n);
  }
  return std::nullopt;
}

static std::string extensionFor(const std::string& mimetype) {
  if (mimetype == kApkMimetype) return ".apk";
  if (mimetype == kZipMimetype) return ".zip";
  return ".bin";
}

std::string generateFilename(const PackageKey& key,
                             const std::string& version,
                             const std::string& mimetype) {
  std::string safe = version;
  for (auto& c : safe) {
    const bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '_';
    if (!ok) c = '_';
  }
  return to_string(key.usage) + "_" + to_string(key.arch) + "_" + safe + extensionFor(mimetype);
}

} // namespace pkgstore
