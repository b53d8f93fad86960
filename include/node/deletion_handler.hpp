#ifndef VAULT_NODE_DELETION_HANDLER_HPP
#define VAULT_NODE_DELETION_HANDLER_HPP

#include <boost/asio/spawn.hpp>
#include "node/types.hpp"
#include "storage/file_store.hpp"
#include "storage/path_mapper.hpp"
#include "sync/cancellation.hpp"

namespace vault {
namespace node {

// Removes a stored file. Deleting something that is not there is a normal
// outcome reported as false.
class DeletionHandler {
public:
  DeletionHandler(storage::FileStore& store, const storage::PathMapper& paths);

  // Throws RpcError with INVALID_ARGUMENT, CANCELLED, DEADLINE_EXCEEDED or INTERNAL
  bool remove(const ObjectTarget& target, sync::CancellationSignal& cancel,
              boost::asio::yield_context yield);

private:
  storage::FileStore& store_;
  const storage::PathMapper& paths_;
};

} // namespace node
} // namespace vault

#endif // VAULT_NODE_DELETION_HANDLER_HPP
