#include "node/object_target.hpp"
#include "node/status.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace vault {
namespace node {

namespace {

bool has_content(const std::string& text) {
  return std::any_of(text.begin(), text.end(),
                     [](unsigned char c) { return !std::isspace(c); });
}

} // namespace

std::filesystem::path resolve_target(const storage::PathMapper& paths, const ObjectTarget& target) {
  try {
    if (has_content(target.final_path)) {
      return paths.resolve_relative(target.final_path);
    }
    if (has_content(target.object_id)) {
      return paths.final_path(target.object_id);
    }
  }
  catch (const std::invalid_argument& e) {
    throw RpcError(StatusCode::INVALID_ARGUMENT, e.what());
  }

  throw RpcError(StatusCode::INVALID_ARGUMENT, "Either ObjectId or FinalPath must be provided");
}

std::string describe_target(const ObjectTarget& target) {
  if (has_content(target.final_path)) {
    return "path " + target.final_path;
  }
  return "object " + target.object_id;
}

} // namespace node
} // namespace vault
