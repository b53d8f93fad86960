#ifndef VAULT_STORAGE_ERROR_HPP
#define VAULT_STORAGE_ERROR_HPP

#include <stdexcept>
#include <string>
#include <system_error>

namespace vault {
namespace storage {

// Raised by FileStore implementations. Carries the OS error code when the
// failing primitive reported one.
class StorageError : public std::runtime_error {
public:
  explicit StorageError(const std::string& message)
    : std::runtime_error(message) {}

  StorageError(const std::string& message, std::error_code code)
    : std::runtime_error(message + ": " + code.message())
    , code_(code) {}

  const std::error_code& code() const noexcept { return code_; }

  // True when the failure means the volume ran out of space or quota.
  // Falls back to inspecting the message when no OS code is attached.
  bool is_disk_full() const;

private:
  std::error_code code_;
};

class FileNotFoundError : public StorageError {
public:
  explicit FileNotFoundError(const std::string& path)
    : StorageError("File not found: " + path) {}
};

} // namespace storage
} // namespace vault

#endif // VAULT_STORAGE_ERROR_HPP
