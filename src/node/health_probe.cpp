#include "node/health_probe.hpp"
#include <utility>
#include <boost/log/trivial.hpp>

namespace vault {
namespace node {

HealthProbe::HealthProbe(std::string node_id, storage::FileStore& store, const storage::PathMapper& paths)
  : node_id_(std::move(node_id)), store_(store), paths_(paths) {}

NodeStatus HealthProbe::probe(boost::asio::yield_context yield) {
  NodeStatus status;
  status.node_id = node_id_;

  try {
    status.alive = store_.is_directory(paths_.base_path(), yield);
    if (status.alive) {
      auto space = store_.space(paths_.base_path(), yield);
      status.free_bytes = space.available;
      status.total_bytes = space.capacity;
    }
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Health: Probe of " << paths_.base_path().string() << " failed: " << e.what();
    status.alive = false;
    status.free_bytes = 0;
    status.total_bytes = 0;
  }

  BOOST_LOG_TRIVIAL(debug) << "Health: alive=" << status.alive << ", free=" << status.free_bytes
                           << ", total=" << status.total_bytes;
  return status;
}

} // namespace node
} // namespace vault
