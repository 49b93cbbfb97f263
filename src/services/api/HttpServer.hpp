#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "core/PackageTypes.hpp"

namespace pkgstore {

class PackageStorage;

nlohmann::json toJson(const PackageInfo& info);

// Start a blocking HTTP server over the package storage.
// apiKey: if empty, auth is disabled.
void run_http_server(PackageStorage& storage,
                     int port,
                     const std::string& apiKey);

} // namespace pkgstore
