#include "node/download_streamer.hpp"
#include "node/object_target.hpp"
#include "node/status.hpp"
#include "storage/storage_error.hpp"
#include <stdexcept>
#include <vector>
#include <boost/log/trivial.hpp>

namespace vault {
namespace node {

DownloadStreamer::DownloadStreamer(sync::ConcurrencyAdmission& admission, storage::FileStore& store,
                                   const storage::PathMapper& paths, std::size_t chunk_size)
  : admission_(admission)
  , store_(store)
  , paths_(paths)
  , chunk_size_(chunk_size) {
  if (chunk_size_ == 0) {
    throw std::invalid_argument("Download: Chunk size must be positive");
  }
}

std::uint64_t DownloadStreamer::download(const ObjectTarget& target, ChunkSink& sink,
                                         sync::CancellationSignal& cancel,
                                         boost::asio::yield_context yield) {
  const auto path = resolve_target(paths_, target);
  const std::string subject = describe_target(target);

  try {
    auto slot = admission_.acquire_download(cancel, yield);

    if (!store_.exists(path, yield)) {
      BOOST_LOG_TRIVIAL(warning) << "Download: File not found for " << subject;
      throw RpcError(StatusCode::NOT_FOUND, "File not found");
    }
    cancel.throw_if_cancelled();

    BOOST_LOG_TRIVIAL(info) << "Download: Starting " << subject << " from " << path.string();

    auto source = store_.read(path, chunk_size_, yield);
    std::vector<char> chunk;
    std::uint64_t total = 0;

    while (true) {
      cancel.throw_if_cancelled();
      if (!source->next(chunk, yield)) {
        break;
      }
      cancel.throw_if_cancelled();
      sink.write(chunk, yield);
      total += chunk.size();
    }

    BOOST_LOG_TRIVIAL(info) << "Download: Completed " << subject << ", " << total << " bytes sent";
    return total;
  }
  catch (const sync::OperationCancelled& e) {
    BOOST_LOG_TRIVIAL(warning) << "Download: Cancelled for " << subject << " (" << e.what() << ")";
    throw RpcError(status_for_cancel(e.reason()), "Download cancelled");
  }
  catch (const storage::FileNotFoundError&) {
    BOOST_LOG_TRIVIAL(warning) << "Download: File vanished before it could be read for " << subject;
    throw RpcError(StatusCode::NOT_FOUND, "File not found");
  }
  catch (const RpcError&) {
    throw;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Download: Error for " << subject << ": " << e.what();
    throw RpcError(StatusCode::INTERNAL, std::string("Download error: ") + e.what());
  }
}

} // namespace node
} // namespace vault
