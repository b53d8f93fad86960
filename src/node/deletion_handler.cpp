#include "node/deletion_handler.hpp"
#include "node/object_target.hpp"
#include "node/status.hpp"
#include <boost/log/trivial.hpp>

namespace vault {
namespace node {

DeletionHandler::DeletionHandler(storage::FileStore& store, const storage::PathMapper& paths)
  : store_(store), paths_(paths) {}

bool DeletionHandler::remove(const ObjectTarget& target, sync::CancellationSignal& cancel,
                             boost::asio::yield_context yield) {
  const auto path = resolve_target(paths_, target);
  const std::string subject = describe_target(target);

  BOOST_LOG_TRIVIAL(info) << "Delete: Removing " << subject << " at " << path.string();

  try {
    cancel.throw_if_cancelled();
    bool deleted = store_.remove(path, yield);

    if (deleted) {
      BOOST_LOG_TRIVIAL(info) << "Delete: Removed " << subject;
    }
    else {
      BOOST_LOG_TRIVIAL(info) << "Delete: Nothing stored for " << subject;
    }
    return deleted;
  }
  catch (const sync::OperationCancelled& e) {
    throw RpcError(status_for_cancel(e.reason()), "Delete cancelled");
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Delete: Error for " << subject << ": " << e.what();
    throw RpcError(StatusCode::INTERNAL, std::string("Delete error: ") + e.what());
  }
}

} // namespace node
} // namespace vault
