#pragma once
#include <memory>

#include "core/Config.hpp"
#include "core/storage/PackageStorage.hpp"

namespace pkgstore {

// Builds the medium named by cfg.storage. Throws std::invalid_argument for an
// unknown medium and StorageBackendError if the database cannot be opened.
std::unique_ptr<PackageStorage> makeStorage(const Config& cfg);

} // namespace pkgstore
