#ifndef VAULT_NODE_NODE_SERVICE_HPP
#define VAULT_NODE_NODE_SERVICE_HPP

#include <cstdint>
#include <memory>
#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include "config/node_config.hpp"
#include "node/deletion_handler.hpp"
#include "node/download_streamer.hpp"
#include "node/health_probe.hpp"
#include "node/types.hpp"
#include "node/upload_coordinator.hpp"
#include "storage/file_store.hpp"
#include "storage/path_mapper.hpp"
#include "sync/concurrency_admission.hpp"
#include "sync/keyed_lock_manager.hpp"

namespace vault {
namespace node {

// The four node operations over one shared set of gates, locks and paths.
// Every member is created here from the configuration; nothing is global.
class NodeService {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  NodeService(const config::NodeConfig& config, boost::asio::io_context& io_context,
              storage::FileStore& store);
  ~NodeService();

  NodeService(const NodeService&) = delete;
  NodeService& operator=(const NodeService&) = delete;


  // ---- NODE OPERATIONS ----
  UploadResult upload(UploadStream& stream, sync::CancellationSignal& cancel,
                      boost::asio::yield_context yield);
  std::uint64_t download(const ObjectTarget& target, ChunkSink& sink,
                         sync::CancellationSignal& cancel, boost::asio::yield_context yield);
  bool remove(const ObjectTarget& target, sync::CancellationSignal& cancel,
              boost::asio::yield_context yield);
  NodeStatus health(boost::asio::yield_context yield);


  // ---- GETTERS ----
  const storage::PathMapper& get_paths() const { return *paths_; }
  sync::ConcurrencyAdmission& get_admission() { return *admission_; }
  sync::KeyedLockManager& get_locks() { return *locks_; }

private:
  // ---- PARAMETERS ----
  std::unique_ptr<storage::PathMapper> paths_;
  std::unique_ptr<sync::ConcurrencyAdmission> admission_;
  std::unique_ptr<sync::KeyedLockManager> locks_;
  std::unique_ptr<UploadCoordinator> uploads_;
  std::unique_ptr<DownloadStreamer> downloads_;
  std::unique_ptr<DeletionHandler> deletions_;
  std::unique_ptr<HealthProbe> health_;
};

} // namespace node
} // namespace vault

#endif // VAULT_NODE_NODE_SERVICE_HPP
