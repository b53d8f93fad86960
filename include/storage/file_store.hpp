#ifndef VAULT_STORAGE_FILE_STORE_HPP
#define VAULT_STORAGE_FILE_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>
#include <boost/asio/spawn.hpp>

namespace vault {
namespace storage {

// Capacity of the volume holding a path
struct VolumeSpace {
  std::uintmax_t capacity = 0;
  std::uintmax_t free = 0;
  std::uintmax_t available = 0;   // Free space usable by unprivileged processes
};

// Pull-based stream of byte chunks
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Replaces chunk with the next run of bytes. Returns false once the
  // source is exhausted, leaving chunk empty.
  virtual bool next(std::vector<char>& chunk, boost::asio::yield_context yield) = 0;
};

// Filesystem primitives used by the node. Every call may suspend the calling
// coroutine. Failures throw StorageError.
class FileStore {
public:
  virtual ~FileStore() = default;

  // ---- BYTE MOVEMENT ----
  // Creates path exclusively (fails if it exists) and fills it from source,
  // flushing to stable storage before returning the byte count
  virtual std::uintmax_t write(const std::filesystem::path& path, ByteSource& source,
                               boost::asio::yield_context yield) = 0;
  // Opens path for reading in chunks of chunk_size bytes. Throws
  // FileNotFoundError when the file is absent.
  virtual std::unique_ptr<ByteSource> read(const std::filesystem::path& path, std::size_t chunk_size,
                                           boost::asio::yield_context yield) = 0;


  // ---- FILE MANAGEMENT ----
  // Unlinks a regular file. Returns false when there was none at path,
  // directories included.
  virtual bool remove(const std::filesystem::path& path, boost::asio::yield_context yield) = 0;
  // True only for regular files
  virtual bool exists(const std::filesystem::path& path, boost::asio::yield_context yield) = 0;
  virtual std::uintmax_t size(const std::filesystem::path& path, boost::asio::yield_context yield) = 0;
  // Atomic rename on the same volume. Never replaces an existing destination.
  virtual void move(const std::filesystem::path& source, const std::filesystem::path& destination,
                    boost::asio::yield_context yield) = 0;
  // Creates the parent directories of file_path
  virtual void ensure_directory(const std::filesystem::path& file_path, boost::asio::yield_context yield) = 0;


  // ---- VOLUME QUERIES ----
  virtual bool is_directory(const std::filesystem::path& path, boost::asio::yield_context yield) = 0;
  virtual VolumeSpace space(const std::filesystem::path& path, boost::asio::yield_context yield) = 0;
};

} // namespace storage
} // namespace vault

#endif // VAULT_STORAGE_FILE_STORE_HPP
