#ifndef VAULT_STORAGE_LOCAL_FILE_STORE_HPP
#define VAULT_STORAGE_LOCAL_FILE_STORE_HPP

#include "storage/file_store.hpp"
#include <boost/asio/thread_pool.hpp>

namespace vault {
namespace storage {

// FileStore over the local POSIX filesystem. Blocking system calls run on the
// supplied thread pool while the calling coroutine is suspended.
class LocalFileStore : public FileStore {
public:
  explicit LocalFileStore(boost::asio::thread_pool& pool);

  LocalFileStore(const LocalFileStore&) = delete;
  LocalFileStore& operator=(const LocalFileStore&) = delete;

  // ---- BYTE MOVEMENT ----
  std::uintmax_t write(const std::filesystem::path& path, ByteSource& source,
                       boost::asio::yield_context yield) override;
  std::unique_ptr<ByteSource> read(const std::filesystem::path& path, std::size_t chunk_size,
                                   boost::asio::yield_context yield) override;


  // ---- FILE MANAGEMENT ----
  bool remove(const std::filesystem::path& path, boost::asio::yield_context yield) override;
  bool exists(const std::filesystem::path& path, boost::asio::yield_context yield) override;
  std::uintmax_t size(const std::filesystem::path& path, boost::asio::yield_context yield) override;
  void move(const std::filesystem::path& source, const std::filesystem::path& destination,
            boost::asio::yield_context yield) override;
  void ensure_directory(const std::filesystem::path& file_path, boost::asio::yield_context yield) override;


  // ---- VOLUME QUERIES ----
  bool is_directory(const std::filesystem::path& path, boost::asio::yield_context yield) override;
  VolumeSpace space(const std::filesystem::path& path, boost::asio::yield_context yield) override;

private:
  boost::asio::thread_pool& pool_;
};

} // namespace storage
} // namespace vault

#endif // VAULT_STORAGE_LOCAL_FILE_STORE_HPP
