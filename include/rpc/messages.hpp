#ifndef VAULT_RPC_MESSAGES_HPP
#define VAULT_RPC_MESSAGES_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "node/status.hpp"
#include "node/types.hpp"
#include "rpc/message_frame.hpp"

namespace vault {
namespace rpc {

// Opening frame of an upload call
struct UploadOpening {
  uint32_t deadline_ms = 0;       // 0 means no deadline
  node::UploadMetadata metadata;
};

// Opening frame of a download or delete call
struct TargetRequest {
  uint32_t deadline_ms = 0;
  node::ObjectTarget target;
};

struct ErrorReply {
  node::StatusCode code = node::StatusCode::INTERNAL;
  std::string message;
};

// ---- UPLOAD MESSAGES ----
MessageFrame make_upload_metadata(const UploadOpening& opening);
UploadOpening parse_upload_metadata(const MessageFrame& frame);
MessageFrame make_upload_chunk(const char* data, std::size_t size);
MessageFrame make_upload_end();
MessageFrame make_upload_result(const node::UploadResult& result);
node::UploadResult parse_upload_result(const MessageFrame& frame);


// ---- DOWNLOAD AND DELETE MESSAGES ----
// type is DOWNLOAD_REQUEST or DELETE_REQUEST
MessageFrame make_target_request(FrameType type, const TargetRequest& request);
TargetRequest parse_target_request(const MessageFrame& frame);
MessageFrame make_download_chunk(const std::vector<char>& chunk);
MessageFrame make_download_end(uint64_t total_bytes);
uint64_t parse_download_end(const MessageFrame& frame);
MessageFrame make_delete_result(bool deleted);
bool parse_delete_result(const MessageFrame& frame);


// ---- HEALTH MESSAGES ----
MessageFrame make_health_request();
MessageFrame make_health_result(const node::NodeStatus& status);
node::NodeStatus parse_health_result(const MessageFrame& frame);


// ---- ERRORS ----
MessageFrame make_error(node::StatusCode code, const std::string& message);
ErrorReply parse_error(const MessageFrame& frame);

} // namespace rpc
} // namespace vault

#endif // VAULT_RPC_MESSAGES_HPP
