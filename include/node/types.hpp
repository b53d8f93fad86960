#ifndef VAULT_NODE_TYPES_HPP
#define VAULT_NODE_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <boost/asio/spawn.hpp>

namespace vault {
namespace node {

// Descriptive fields sent ahead of an upload's payload. Only object_id
// influences where the object is stored.
struct UploadMetadata {
  std::string object_id;
  std::string created_at_utc;     // YYYY-MM-DDTHH:mm:ss.fffffffZ
  std::string content_type;
  std::string original_filename;
};

// Outcome of an upload. Validation problems come back here with
// success == false rather than as a fault.
struct UploadResult {
  bool success = false;
  std::string error;
  std::string final_path;         // Relative to the storage root
  std::uint64_t size = 0;
  std::string checksum;           // Lowercase hex SHA-256

  static UploadResult rejected(const std::string& message) {
    UploadResult result;
    result.error = message;
    return result;
  }
};

struct NodeStatus {
  std::string node_id;
  bool alive = false;
  std::uint64_t free_bytes = 0;
  std::uint64_t total_bytes = 0;
};

// Addresses a stored file either by object id (canonical location) or by a
// relative path returned from an earlier upload. The path wins when both
// are set.
struct ObjectTarget {
  std::string object_id;
  std::string final_path;

  bool has_final_path() const { return !final_path.empty(); }
};

// One inbound element of an upload stream
struct UploadUnit {
  enum class Kind {
    METADATA,
    CHUNK
  };

  Kind kind = Kind::CHUNK;
  UploadMetadata metadata;
  std::vector<char> chunk;
};

// Inbound side of an upload call
class UploadStream {
public:
  virtual ~UploadStream() = default;

  // Fills unit with the next element. Returns false at end of stream.
  virtual bool next(UploadUnit& unit, boost::asio::yield_context yield) = 0;
};

// Outbound side of a download call
class ChunkSink {
public:
  virtual ~ChunkSink() = default;

  virtual void write(const std::vector<char>& chunk, boost::asio::yield_context yield) = 0;
};

} // namespace node
} // namespace vault

#endif // VAULT_NODE_TYPES_HPP
