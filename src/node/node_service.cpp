#include "node/node_service.hpp"
#include <boost/log/trivial.hpp>

namespace vault {
namespace node {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

NodeService::NodeService(const config::NodeConfig& config, boost::asio::io_context& io_context,
                         storage::FileStore& store) {
  paths_ = std::make_unique<storage::PathMapper>(config.base_path, config.temp_dir_name,
                                                 config.shard_symbol_count, config.shard_level_count);

  admission_ = std::make_unique<sync::ConcurrencyAdmission>(io_context, config.max_concurrent_uploads,
                                                            config.max_concurrent_downloads);
  locks_ = std::make_unique<sync::KeyedLockManager>(io_context, config.lock_pool_size);

  uploads_ = std::make_unique<UploadCoordinator>(*admission_, *locks_, store, *paths_);
  downloads_ = std::make_unique<DownloadStreamer>(*admission_, store, *paths_, config.chunk_size_bytes);
  deletions_ = std::make_unique<DeletionHandler>(store, *paths_);
  health_ = std::make_unique<HealthProbe>(config.node_id, store, *paths_);

  BOOST_LOG_TRIVIAL(info) << "Node service: Ready for node " << config.node_id
                          << " (" << config.node_name << ") at " << config.base_path;
}

NodeService::~NodeService() = default;


//==============================================
// NODE OPERATIONS
//==============================================

UploadResult NodeService::upload(UploadStream& stream, sync::CancellationSignal& cancel,
                                 boost::asio::yield_context yield) {
  return uploads_->upload(stream, cancel, yield);
}

std::uint64_t NodeService::download(const ObjectTarget& target, ChunkSink& sink,
                                    sync::CancellationSignal& cancel, boost::asio::yield_context yield) {
  return downloads_->download(target, sink, cancel, yield);
}

bool NodeService::remove(const ObjectTarget& target, sync::CancellationSignal& cancel,
                         boost::asio::yield_context yield) {
  return deletions_->remove(target, cancel, yield);
}

NodeStatus NodeService::health(boost::asio::yield_context yield) {
  return health_->probe(yield);
}

} // namespace node
} // namespace vault
