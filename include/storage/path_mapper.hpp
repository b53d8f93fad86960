#ifndef VAULT_STORAGE_PATH_MAPPER_HPP
#define VAULT_STORAGE_PATH_MAPPER_HPP

#include <cstddef>
#include <filesystem>
#include <string>

namespace vault {
namespace storage {

// Maps object identifiers to deterministic, hash-sharded locations under a
// base directory:
//   {base_path}/{hash[0:n]}/{hash[n:2n]}/.../{object_id}[.ext]
// where hash is the lowercase hex SHA-256 of the object id.
class PathMapper {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  PathMapper(const std::filesystem::path& base_path, const std::string& temp_dir_name,
             std::size_t shard_symbol_count, std::size_t shard_level_count);


  // ---- PATH DERIVATION ----
  // Canonical absolute location for an object
  std::filesystem::path final_path(const std::string& object_id,
                                   const std::string& extension = "") const;
  // Unique temp location inside the temp directory for an upload attempt
  std::filesystem::path temp_path(const std::string& object_id,
                                  const std::string& extension = "") const;
  // Key used for per-object locking
  std::string lock_key(const std::string& object_id) const;
  // Canonical location relative to the base path
  std::filesystem::path relative_path(const std::string& object_id,
                                      const std::string& extension = "") const;


  // ---- CALLER SUPPLIED PATHS ----
  // Resolves a caller supplied relative path under the base path. Rejects
  // absolute paths and paths that climb out of the base path.
  std::filesystem::path resolve_relative(const std::string& relative) const;
  // Converts an absolute path under the base path back to a relative one
  std::string relative_to_base(const std::filesystem::path& absolute) const;


  // ---- GETTERS ----
  const std::filesystem::path& base_path() const { return base_path_; }
  const std::filesystem::path& temp_directory() const { return temp_directory_; }

  // Hex SHA-256 of the object id
  static std::string hash_object_id(const std::string& object_id);
  // False when the id would not stay a single path component
  static bool is_safe_filename(const std::string& object_id);

private:
  // ---- PARAMETERS ----
  std::filesystem::path base_path_;
  std::filesystem::path temp_directory_;
  std::size_t shard_symbol_count_;
  std::size_t shard_level_count_;


  // ---- SHARD SUPPORT ----
  // Throws std::invalid_argument for empty or whitespace-only ids
  static void check_object_id(const std::string& object_id);
  // Object id plus optional extension, normalized to start with a dot
  static std::string build_filename(const std::string& object_id, const std::string& extension);
  // Nested shard directories taken from the id hash
  std::filesystem::path shard_path(const std::string& object_id) const;
};

} // namespace storage
} // namespace vault

#endif // VAULT_STORAGE_PATH_MAPPER_HPP
