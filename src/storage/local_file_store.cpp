#include "storage/local_file_store.hpp"
#include "storage/blocking_call.hpp"
#include "storage/storage_error.hpp"
#include <cerrno>
#include <cstdio>
#include <stdexcept>
#include <system_error>
#include <fcntl.h>
#include <unistd.h>
#include <boost/log/trivial.hpp>

namespace vault {
namespace storage {

namespace {

std::error_code last_error() {
  return std::error_code(errno, std::generic_category());
}

// Owns a POSIX file descriptor
class FileDescriptor {
public:
  explicit FileDescriptor(int fd) : fd_(fd) {}

  ~FileDescriptor() {
    if (fd_ >= 0 && ::close(fd_) != 0) {
      BOOST_LOG_TRIVIAL(warning) << "File store: Failed to close descriptor " << fd_;
    }
  }

  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  int get() const { return fd_; }

  // Closes now and reports the result, which can carry deferred write errors
  void close(const std::filesystem::path& path) {
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
      throw StorageError("Failed to close " + path.string(), last_error());
    }
  }

private:
  int fd_;
};

void write_all(int fd, const char* data, std::size_t length, const std::filesystem::path& path) {
  while (length > 0) {
    ssize_t written = ::write(fd, data, length);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw StorageError("Failed to write " + path.string(), last_error());
    }
    data += written;
    length -= static_cast<std::size_t>(written);
  }
}

// Fills buffer up to length bytes, returning fewer only at end of file
std::size_t read_full(int fd, char* buffer, std::size_t length, const std::filesystem::path& path) {
  std::size_t total = 0;
  while (total < length) {
    ssize_t count = ::read(fd, buffer + total, length - total);
    if (count < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw StorageError("Failed to read " + path.string(), last_error());
    }
    if (count == 0) {
      break;
    }
    total += static_cast<std::size_t>(count);
  }
  return total;
}

// Flushes a directory entry change; failures only cost durability of the rename
void sync_directory(const std::filesystem::path& directory) {
  int fd = ::open(directory.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    BOOST_LOG_TRIVIAL(debug) << "File store: Could not open directory for sync: " << directory.string();
    return;
  }
  FileDescriptor handle(fd);
  if (::fsync(handle.get()) != 0) {
    BOOST_LOG_TRIVIAL(debug) << "File store: Directory sync failed for " << directory.string();
  }
}

// Rename that fails with EEXIST instead of replacing the destination
void rename_no_replace(const std::filesystem::path& source, const std::filesystem::path& destination) {
  if (::renameat2(AT_FDCWD, source.c_str(), AT_FDCWD, destination.c_str(), RENAME_NOREPLACE) == 0) {
    return;
  }

  int error = errno;
  if (error != EINVAL && error != ENOSYS) {
    throw StorageError("Failed to move " + source.string() + " to " + destination.string(),
                       std::error_code(error, std::generic_category()));
  }

  // Filesystem without RENAME_NOREPLACE: link() refuses existing targets too
  if (::link(source.c_str(), destination.c_str()) != 0) {
    throw StorageError("Failed to move " + source.string() + " to " + destination.string(), last_error());
  }
  if (::unlink(source.c_str()) != 0) {
    BOOST_LOG_TRIVIAL(warning) << "File store: Moved by link but could not unlink " << source.string();
  }
}

class FileByteSource : public ByteSource {
public:
  FileByteSource(boost::asio::thread_pool& pool, std::shared_ptr<FileDescriptor> file,
                 std::filesystem::path path, std::size_t chunk_size)
    : pool_(pool), file_(std::move(file)), path_(std::move(path)), chunk_size_(chunk_size) {}

  bool next(std::vector<char>& chunk, boost::asio::yield_context yield) override {
    if (!file_) {
      chunk.clear();
      return false;
    }

    chunk.resize(chunk_size_);
    std::size_t count = run_blocking(pool_, [file = file_, path = path_, &chunk]() {
      return read_full(file->get(), chunk.data(), chunk.size(), path);
    }, yield);
    chunk.resize(count);

    if (count == 0) {
      file_.reset();
      return false;
    }
    return true;
  }

private:
  boost::asio::thread_pool& pool_;
  std::shared_ptr<FileDescriptor> file_;
  std::filesystem::path path_;
  std::size_t chunk_size_;
};

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

LocalFileStore::LocalFileStore(boost::asio::thread_pool& pool) : pool_(pool) {}


//==============================================
// BYTE MOVEMENT
//==============================================

std::uintmax_t LocalFileStore::write(const std::filesystem::path& path, ByteSource& source,
                                     boost::asio::yield_context yield) {
  BOOST_LOG_TRIVIAL(debug) << "File store: Creating " << path.string();

  auto file = run_blocking(pool_, [path]() {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
      throw StorageError("Failed to create " + path.string(), last_error());
    }
    return std::make_shared<FileDescriptor>(fd);
  }, yield);

  std::uintmax_t total = 0;
  std::vector<char> chunk;

  while (source.next(chunk, yield)) {
    if (chunk.empty()) {
      continue;
    }
    run_blocking(pool_, [file, &path, &chunk]() {
      write_all(file->get(), chunk.data(), chunk.size(), path);
    }, yield);
    total += chunk.size();
  }

  run_blocking(pool_, [file, &path]() {
    if (::fsync(file->get()) != 0) {
      throw StorageError("Failed to flush " + path.string(), last_error());
    }
    file->close(path);
  }, yield);

  BOOST_LOG_TRIVIAL(debug) << "File store: Wrote " << total << " bytes to " << path.string();
  return total;
}

std::unique_ptr<ByteSource> LocalFileStore::read(const std::filesystem::path& path, std::size_t chunk_size,
                                                 boost::asio::yield_context yield) {
  if (chunk_size == 0) {
    throw std::invalid_argument("File store: Chunk size must be positive");
  }

  auto file = run_blocking(pool_, [path]() {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
      if (errno == ENOENT) {
        throw FileNotFoundError(path.string());
      }
      throw StorageError("Failed to open " + path.string(), last_error());
    }
    return std::make_shared<FileDescriptor>(fd);
  }, yield);

  return std::make_unique<FileByteSource>(pool_, std::move(file), path, chunk_size);
}


//==============================================
// FILE MANAGEMENT
//==============================================

bool LocalFileStore::remove(const std::filesystem::path& path, boost::asio::yield_context yield) {
  return run_blocking(pool_, [path]() {
    std::error_code ec;
    auto status = std::filesystem::symlink_status(path, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
      return false;
    }
    if (ec) {
      throw StorageError("Failed to stat " + path.string(), ec);
    }
    // Directories and other special entries are never objects
    if (!std::filesystem::is_regular_file(status)) {
      BOOST_LOG_TRIVIAL(debug) << "File store: Not removing non-file " << path.string();
      return false;
    }
    bool removed = std::filesystem::remove(path, ec);
    if (ec) {
      throw StorageError("Failed to delete " + path.string(), ec);
    }
    return removed;
  }, yield);
}

bool LocalFileStore::exists(const std::filesystem::path& path, boost::asio::yield_context yield) {
  return run_blocking(pool_, [path]() {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
      return false;
    }
    if (ec) {
      throw StorageError("Failed to stat " + path.string(), ec);
    }
    return std::filesystem::is_regular_file(status);
  }, yield);
}

std::uintmax_t LocalFileStore::size(const std::filesystem::path& path, boost::asio::yield_context yield) {
  return run_blocking(pool_, [path]() {
    std::error_code ec;
    std::uintmax_t bytes = std::filesystem::file_size(path, ec);
    if (ec == std::errc::no_such_file_or_directory) {
      throw FileNotFoundError(path.string());
    }
    if (ec) {
      throw StorageError("Failed to size " + path.string(), ec);
    }
    return bytes;
  }, yield);
}

void LocalFileStore::move(const std::filesystem::path& source, const std::filesystem::path& destination,
                          boost::asio::yield_context yield) {
  BOOST_LOG_TRIVIAL(debug) << "File store: Moving " << source.string() << " to " << destination.string();

  run_blocking(pool_, [source, destination]() {
    rename_no_replace(source, destination);
    sync_directory(destination.parent_path());
  }, yield);
}

void LocalFileStore::ensure_directory(const std::filesystem::path& file_path, boost::asio::yield_context yield) {
  auto directory = file_path.parent_path();
  if (directory.empty()) {
    return;
  }

  run_blocking(pool_, [directory]() {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
      throw StorageError("Failed to create directory " + directory.string(), ec);
    }
  }, yield);
}


//==============================================
// VOLUME QUERIES
//==============================================

bool LocalFileStore::is_directory(const std::filesystem::path& path, boost::asio::yield_context yield) {
  return run_blocking(pool_, [path]() {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
      return false;
    }
    if (ec) {
      throw StorageError("Failed to stat " + path.string(), ec);
    }
    return std::filesystem::is_directory(status);
  }, yield);
}

VolumeSpace LocalFileStore::space(const std::filesystem::path& path, boost::asio::yield_context yield) {
  return run_blocking(pool_, [path]() {
    std::error_code ec;
    auto info = std::filesystem::space(path, ec);
    if (ec) {
      throw StorageError("Failed to query volume space for " + path.string(), ec);
    }
    VolumeSpace result;
    result.capacity = info.capacity;
    result.free = info.free;
    result.available = info.available;
    return result;
  }, yield);
}

} // namespace storage
} // namespace vault
