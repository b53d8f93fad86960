#ifndef VAULT_NODE_HEALTH_PROBE_HPP
#define VAULT_NODE_HEALTH_PROBE_HPP

#include <string>
#include <boost/asio/spawn.hpp>
#include "node/types.hpp"
#include "storage/file_store.hpp"
#include "storage/path_mapper.hpp"

namespace vault {
namespace node {

// Reports liveness and capacity of the volume holding the storage root
class HealthProbe {
public:
  HealthProbe(std::string node_id, storage::FileStore& store, const storage::PathMapper& paths);

  // Never throws: probe failures report alive == false with zero capacity
  NodeStatus probe(boost::asio::yield_context yield);

private:
  std::string node_id_;
  storage::FileStore& store_;
  const storage::PathMapper& paths_;
};

} // namespace node
} // namespace vault

#endif // VAULT_NODE_HEALTH_PROBE_HPP
