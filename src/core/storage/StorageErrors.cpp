#include "core/storage/StorageErrors.hpp"

namespace pkgstore {

const char* to_string(SaveErrorKind kind) {
  switch (kind) {
    case SaveErrorKind::None:           return "none";
    case SaveErrorKind::InvalidInput:   return "invalid-input";
    case SaveErrorKind::StorageBackend: return "storage-backend";
    case SaveErrorKind::NotFound:       return "not-found";
    case SaveErrorKind::Unknown:        return "unknown";
  }
  return "unknown";
}

} // namespace pkgstore
