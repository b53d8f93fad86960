#include "node/status.hpp"

namespace vault {
namespace node {

std::string status_code_to_string(StatusCode code) {
  switch (code) {
    case StatusCode::OK:                 return "OK";
    case StatusCode::CANCELLED:          return "CANCELLED";
    case StatusCode::INVALID_ARGUMENT:   return "INVALID_ARGUMENT";
    case StatusCode::DEADLINE_EXCEEDED:  return "DEADLINE_EXCEEDED";
    case StatusCode::NOT_FOUND:          return "NOT_FOUND";
    case StatusCode::RESOURCE_EXHAUSTED: return "RESOURCE_EXHAUSTED";
    case StatusCode::INTERNAL:           return "INTERNAL";
    default:                             return "UNKNOWN";
  }
}

bool is_known_status_code(std::uint8_t value) {
  switch (static_cast<StatusCode>(value)) {
    case StatusCode::OK:
    case StatusCode::CANCELLED:
    case StatusCode::INVALID_ARGUMENT:
    case StatusCode::DEADLINE_EXCEEDED:
    case StatusCode::NOT_FOUND:
    case StatusCode::RESOURCE_EXHAUSTED:
    case StatusCode::INTERNAL:
      return true;
  }
  return false;
}

std::ostream& operator<<(std::ostream& os, StatusCode code) {
  os << status_code_to_string(code);
  return os;
}

StatusCode status_for_cancel(sync::CancelReason reason) {
  return reason == sync::CancelReason::DEADLINE ? StatusCode::DEADLINE_EXCEEDED
                                                : StatusCode::CANCELLED;
}

} // namespace node
} // namespace vault
