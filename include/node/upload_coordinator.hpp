#ifndef VAULT_NODE_UPLOAD_COORDINATOR_HPP
#define VAULT_NODE_UPLOAD_COORDINATOR_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <boost/asio/spawn.hpp>
#include "node/status.hpp"
#include "node/types.hpp"
#include "node/upload_state.hpp"
#include "storage/file_store.hpp"
#include "storage/path_mapper.hpp"
#include "sync/cancellation.hpp"
#include "sync/concurrency_admission.hpp"
#include "sync/keyed_lock_manager.hpp"

namespace vault {
namespace node {

// Turns an inbound upload stream into a committed object. The payload goes to
// an exclusive temp file while its SHA-256 is computed, then a single
// no-replace rename publishes it at the canonical path or, when that is
// taken, at the first free versioned path (name_1.ext, name_2.ext, ...).
class UploadCoordinator {
public:
  // ---- CONSTRUCTOR ----
  UploadCoordinator(sync::ConcurrencyAdmission& admission, sync::KeyedLockManager& locks,
                    storage::FileStore& store, const storage::PathMapper& paths);


  // ---- UPLOAD OPERATION ----
  // Returns a negative result for invalid metadata. Throws RpcError for
  // protocol violations, cancellation, storage and unexpected failures.
  // The temp file is gone and the slot and key lock are released on every path.
  UploadResult upload(UploadStream& stream, sync::CancellationSignal& cancel,
                      boost::asio::yield_context yield);

  // Rejection message for metadata, or nothing when it is acceptable
  static std::optional<std::string> validate_metadata(const UploadMetadata& metadata);

private:
  // Resources held by one call, released when it goes out of scope
  struct Attempt {
    sync::AsyncSemaphore::Permit slot;
    sync::KeyedLockManager::KeyLock key_lock;
    UploadState state;
    std::string object_id;
    std::filesystem::path temp_path;
    bool temp_created = false;
  };

  // ---- PARAMETERS ----
  sync::ConcurrencyAdmission& admission_;
  sync::KeyedLockManager& locks_;
  storage::FileStore& store_;
  const storage::PathMapper& paths_;


  // ---- UPLOAD PHASES ----
  UploadResult run(Attempt& attempt, UploadStream& stream, sync::CancellationSignal& cancel,
                   boost::asio::yield_context yield);
  // Canonical path when free, else the first unused versioned sibling
  std::filesystem::path choose_destination(const std::filesystem::path& canonical,
                                           boost::asio::yield_context yield);
  // Best-effort removal of a partially written temp file
  void discard_temp(Attempt& attempt, boost::asio::yield_context yield);
};

} // namespace node
} // namespace vault

#endif // VAULT_NODE_UPLOAD_COORDINATOR_HPP
