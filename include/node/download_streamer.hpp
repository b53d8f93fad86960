#ifndef VAULT_NODE_DOWNLOAD_STREAMER_HPP
#define VAULT_NODE_DOWNLOAD_STREAMER_HPP

#include <cstddef>
#include <cstdint>
#include <boost/asio/spawn.hpp>
#include "node/types.hpp"
#include "storage/file_store.hpp"
#include "storage/path_mapper.hpp"
#include "sync/cancellation.hpp"
#include "sync/concurrency_admission.hpp"

namespace vault {
namespace node {

// Streams a stored file to a sink in fixed-size chunks, in file order.
// Does not take the per-object lock.
class DownloadStreamer {
public:
  DownloadStreamer(sync::ConcurrencyAdmission& admission, storage::FileStore& store,
                   const storage::PathMapper& paths, std::size_t chunk_size);

  // Returns the number of bytes sent. Throws RpcError with NOT_FOUND,
  // INVALID_ARGUMENT, CANCELLED, DEADLINE_EXCEEDED or INTERNAL.
  std::uint64_t download(const ObjectTarget& target, ChunkSink& sink,
                         sync::CancellationSignal& cancel, boost::asio::yield_context yield);

  std::size_t chunk_size() const { return chunk_size_; }

private:
  sync::ConcurrencyAdmission& admission_;
  storage::FileStore& store_;
  const storage::PathMapper& paths_;
  std::size_t chunk_size_;
};

} // namespace node
} // namespace vault

#endif // VAULT_NODE_DOWNLOAD_STREAMER_HPP
