#ifndef VAULT_NODE_OBJECT_TARGET_HPP
#define VAULT_NODE_OBJECT_TARGET_HPP

#include <filesystem>
#include "node/types.hpp"
#include "storage/path_mapper.hpp"

namespace vault {
namespace node {

// Absolute location addressed by a download or delete request. A relative
// path is taken as-is under the storage root; an object id maps to its
// canonical (unversioned) path. Throws RpcError(INVALID_ARGUMENT) when
// neither is usable.
std::filesystem::path resolve_target(const storage::PathMapper& paths, const ObjectTarget& target);

// Identifier used in log lines for a target
std::string describe_target(const ObjectTarget& target);

} // namespace node
} // namespace vault

#endif // VAULT_NODE_OBJECT_TARGET_HPP
