#ifndef VAULT_NODE_STATUS_HPP
#define VAULT_NODE_STATUS_HPP

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include "sync/cancellation.hpp"

namespace vault {
namespace node {

// Call outcome codes, numbered as in gRPC so clients can map them directly
enum class StatusCode : std::uint8_t {
  OK = 0,
  CANCELLED = 1,
  INVALID_ARGUMENT = 3,
  DEADLINE_EXCEEDED = 4,
  NOT_FOUND = 5,
  RESOURCE_EXHAUSTED = 8,
  INTERNAL = 13
};

std::string status_code_to_string(StatusCode code);

// False for values outside the enumeration
bool is_known_status_code(std::uint8_t value);

std::ostream& operator<<(std::ostream& os, StatusCode code);

// CANCELLED for caller aborts, DEADLINE_EXCEEDED when the deadline fired
StatusCode status_for_cancel(sync::CancelReason reason);

// Fault that crosses the call boundary with a status code
class RpcError : public std::runtime_error {
public:
  RpcError(StatusCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

  StatusCode code() const { return code_; }

private:
  StatusCode code_;
};

} // namespace node
} // namespace vault

#endif // VAULT_NODE_STATUS_HPP
