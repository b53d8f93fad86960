#include "storage/path_mapper.hpp"
#include "storage/sha256_digest.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace vault {
namespace storage {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

PathMapper::PathMapper(const std::filesystem::path& base_path, const std::string& temp_dir_name,
                       std::size_t shard_symbol_count, std::size_t shard_level_count)
  : base_path_(base_path)
  , temp_directory_(base_path / temp_dir_name)
  , shard_symbol_count_(shard_symbol_count)
  , shard_level_count_(shard_level_count) {
  if (shard_symbol_count_ == 0 || shard_level_count_ == 0) {
    throw std::invalid_argument("Path mapper: Shard symbol and level counts must be positive");
  }
  BOOST_LOG_TRIVIAL(debug) << "Path mapper: Base path " << base_path_.string()
                           << ", " << shard_level_count_ << " levels of "
                           << shard_symbol_count_ << " symbols";
}


//==============================================
// PATH DERIVATION
//==============================================

std::filesystem::path PathMapper::final_path(const std::string& object_id,
                                             const std::string& extension) const {
  check_object_id(object_id);
  return base_path_ / shard_path(object_id) / build_filename(object_id, extension);
}

std::filesystem::path PathMapper::temp_path(const std::string& object_id,
                                            const std::string& extension) const {
  check_object_id(object_id);

  auto timestamp = std::chrono::duration_cast<std::chrono::nanoseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();

  std::string temp_name = build_filename(object_id, extension) + "_" +
                          std::to_string(timestamp) + ".uploading";
  return temp_directory_ / temp_name;
}

std::string PathMapper::lock_key(const std::string& object_id) const {
  check_object_id(object_id);
  return object_id;
}

std::filesystem::path PathMapper::relative_path(const std::string& object_id,
                                                const std::string& extension) const {
  check_object_id(object_id);
  return shard_path(object_id) / build_filename(object_id, extension);
}


//==============================================
// CALLER SUPPLIED PATHS
//==============================================

std::filesystem::path PathMapper::resolve_relative(const std::string& relative) const {
  std::filesystem::path candidate(relative);

  if (candidate.empty() || candidate.is_absolute() || candidate.has_root_name()) {
    throw std::invalid_argument("Path mapper: Path must be relative to the storage root: " + relative);
  }

  for (const auto& part : candidate) {
    if (part == "..") {
      throw std::invalid_argument("Path mapper: Path must not leave the storage root: " + relative);
    }
  }

  return base_path_ / candidate;
}

std::string PathMapper::relative_to_base(const std::filesystem::path& absolute) const {
  return absolute.lexically_relative(base_path_).generic_string();
}

std::string PathMapper::hash_object_id(const std::string& object_id) {
  return Sha256Digest::hex_of(object_id);
}


//==============================================
// SHARD SUPPORT
//==============================================

void PathMapper::check_object_id(const std::string& object_id) {
  bool blank = std::all_of(object_id.begin(), object_id.end(),
    [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
  if (blank) {
    throw std::invalid_argument("ObjectId cannot be empty or whitespace");
  }
  if (!is_safe_filename(object_id)) {
    throw std::invalid_argument("ObjectId cannot contain path separators: " + object_id);
  }
}

bool PathMapper::is_safe_filename(const std::string& object_id) {
  if (object_id == "." || object_id == "..") {
    return false;
  }
  return object_id.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

std::string PathMapper::build_filename(const std::string& object_id, const std::string& extension) {
  if (extension.empty()) {
    return object_id;
  }
  return object_id + (extension.front() == '.' ? extension : "." + extension);
}

std::filesystem::path PathMapper::shard_path(const std::string& object_id) const {
  const std::string hash = hash_object_id(object_id);

  std::filesystem::path path;
  std::size_t position = 0;

  for (std::size_t level = 0; level < shard_level_count_; ++level) {
    // Short hash yields fewer levels rather than an error
    if (position + shard_symbol_count_ > hash.size()) {
      break;
    }
    path /= hash.substr(position, shard_symbol_count_);
    position += shard_symbol_count_;
  }

  return path;
}

} // namespace storage
} // namespace vault
