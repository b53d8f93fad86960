#include "storage/storage_error.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>

namespace vault {
namespace storage {

namespace {

bool contains_ignore_case(const std::string& text, const std::string& needle) {
  auto it = std::search(text.begin(), text.end(), needle.begin(), needle.end(),
    [](char a, char b) {
      return std::tolower(static_cast<unsigned char>(a)) ==
             std::tolower(static_cast<unsigned char>(b));
    });
  return it != text.end();
}

} // namespace

bool StorageError::is_disk_full() const {
  if (code_) {
    if (code_ == std::errc::no_space_on_device || code_ == std::errc::file_too_large) {
      return true;
    }
#ifdef EDQUOT
    if (code_.category() == std::generic_category() || code_.category() == std::system_category()) {
      if (code_.value() == EDQUOT) {
        return true;
      }
    }
#endif
    return false;
  }

  // No OS code available, match on the message text
  const std::string message(what());
  return contains_ignore_case(message, "disk") || contains_ignore_case(message, "space");
}

} // namespace storage
} // namespace vault
