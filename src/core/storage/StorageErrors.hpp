#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace pkgstore {

class StorageError : public std::runtime_error {
public:
  explicit StorageError(const std::string& message) : std::runtime_error(message) {}
};

// Malformed arguments, e.g. a non-positive chunk size.
class InvalidInput : public StorageError {
public:
  explicit InvalidInput(const std::string& message) : StorageError(message) {}
};

// Anything the SQLite substrate reports: open, prepare, step, constraints, busy.
class StorageBackendError : public StorageError {
public:
  explicit StorageBackendError(const std::string& message) : StorageError(message) {}
};

class NotFound : public StorageError {
public:
  explicit NotFound(const std::string& message) : StorageError(message) {}
};

enum class SaveErrorKind {
  None,
  InvalidInput,
  StorageBackend,
  NotFound,
  Unknown,
};

const char* to_string(SaveErrorKind kind);

// Outcome of a save with the failure kind kept.
struct SaveResult {
  SaveErrorKind error = SaveErrorKind::None;
  std::string   message;

  bool ok() const { return error == SaveErrorKind::None; }
  explicit operator bool() const { return ok(); }

  static SaveResult success() { return {}; }
  static SaveResult failure(SaveErrorKind kind, std::string msg) { return {kind, std::move(msg)}; }
};

} // namespace pkgstore
