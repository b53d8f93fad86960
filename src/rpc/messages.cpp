#include "rpc/messages.hpp"
#include "rpc/codec.hpp"
#include <utility>

namespace vault {
namespace rpc {

namespace {

void expect_type(const MessageFrame& frame, FrameType expected) {
  if (frame.type != expected) {
    throw ProtocolError("Messages: Expected " + frame_type_to_string(expected) + " but got " +
                        frame_type_to_string(frame.type));
  }
}

MessageFrame make_frame(FrameType type, PayloadWriter& writer) {
  MessageFrame frame;
  frame.type = type;
  frame.payload = std::move(writer.data());
  return frame;
}

} // namespace

//==============================================
// UPLOAD MESSAGES
//==============================================

MessageFrame make_upload_metadata(const UploadOpening& opening) {
  PayloadWriter writer;
  writer.write_u32(opening.deadline_ms);
  writer.write_string(opening.metadata.object_id);
  writer.write_string(opening.metadata.created_at_utc);
  writer.write_string(opening.metadata.content_type);
  writer.write_string(opening.metadata.original_filename);
  return make_frame(FrameType::UPLOAD_METADATA, writer);
}

UploadOpening parse_upload_metadata(const MessageFrame& frame) {
  expect_type(frame, FrameType::UPLOAD_METADATA);
  PayloadReader reader(frame.payload);

  UploadOpening opening;
  opening.deadline_ms = reader.read_u32();
  opening.metadata.object_id = reader.read_string();
  opening.metadata.created_at_utc = reader.read_string();
  opening.metadata.content_type = reader.read_string();
  opening.metadata.original_filename = reader.read_string();
  reader.expect_end();
  return opening;
}

MessageFrame make_upload_chunk(const char* data, std::size_t size) {
  MessageFrame frame;
  frame.type = FrameType::UPLOAD_CHUNK;
  frame.payload.assign(data, data + size);
  return frame;
}

MessageFrame make_upload_end() {
  MessageFrame frame;
  frame.type = FrameType::UPLOAD_END;
  return frame;
}

MessageFrame make_upload_result(const node::UploadResult& result) {
  PayloadWriter writer;
  writer.write_u8(result.success ? 1 : 0);
  writer.write_string(result.error);
  writer.write_string(result.final_path);
  writer.write_u64(result.size);
  writer.write_string(result.checksum);
  return make_frame(FrameType::UPLOAD_RESULT, writer);
}

node::UploadResult parse_upload_result(const MessageFrame& frame) {
  expect_type(frame, FrameType::UPLOAD_RESULT);
  PayloadReader reader(frame.payload);

  node::UploadResult result;
  result.success = reader.read_u8() != 0;
  result.error = reader.read_string();
  result.final_path = reader.read_string();
  result.size = reader.read_u64();
  result.checksum = reader.read_string();
  reader.expect_end();
  return result;
}


//==============================================
// DOWNLOAD AND DELETE MESSAGES
//==============================================

MessageFrame make_target_request(FrameType type, const TargetRequest& request) {
  if (type != FrameType::DOWNLOAD_REQUEST && type != FrameType::DELETE_REQUEST) {
    throw ProtocolError("Messages: " + frame_type_to_string(type) + " does not address a stored object");
  }
  PayloadWriter writer;
  writer.write_u32(request.deadline_ms);
  writer.write_string(request.target.object_id);
  writer.write_string(request.target.final_path);
  return make_frame(type, writer);
}

TargetRequest parse_target_request(const MessageFrame& frame) {
  if (frame.type != FrameType::DOWNLOAD_REQUEST && frame.type != FrameType::DELETE_REQUEST) {
    throw ProtocolError("Messages: Expected a download or delete request but got " +
                        frame_type_to_string(frame.type));
  }
  PayloadReader reader(frame.payload);

  TargetRequest request;
  request.deadline_ms = reader.read_u32();
  request.target.object_id = reader.read_string();
  request.target.final_path = reader.read_string();
  reader.expect_end();
  return request;
}

MessageFrame make_download_chunk(const std::vector<char>& chunk) {
  MessageFrame frame;
  frame.type = FrameType::DOWNLOAD_CHUNK;
  frame.payload = chunk;
  return frame;
}

MessageFrame make_download_end(uint64_t total_bytes) {
  PayloadWriter writer;
  writer.write_u64(total_bytes);
  return make_frame(FrameType::DOWNLOAD_END, writer);
}

uint64_t parse_download_end(const MessageFrame& frame) {
  expect_type(frame, FrameType::DOWNLOAD_END);
  PayloadReader reader(frame.payload);
  uint64_t total = reader.read_u64();
  reader.expect_end();
  return total;
}

MessageFrame make_delete_result(bool deleted) {
  PayloadWriter writer;
  writer.write_u8(deleted ? 1 : 0);
  return make_frame(FrameType::DELETE_RESULT, writer);
}

bool parse_delete_result(const MessageFrame& frame) {
  expect_type(frame, FrameType::DELETE_RESULT);
  PayloadReader reader(frame.payload);
  bool deleted = reader.read_u8() != 0;
  reader.expect_end();
  return deleted;
}


//==============================================
// HEALTH MESSAGES
//==============================================

MessageFrame make_health_request() {
  MessageFrame frame;
  frame.type = FrameType::HEALTH_REQUEST;
  return frame;
}

MessageFrame make_health_result(const node::NodeStatus& status) {
  PayloadWriter writer;
  writer.write_string(status.node_id);
  writer.write_u8(status.alive ? 1 : 0);
  writer.write_u64(status.free_bytes);
  writer.write_u64(status.total_bytes);
  return make_frame(FrameType::HEALTH_RESULT, writer);
}

node::NodeStatus parse_health_result(const MessageFrame& frame) {
  expect_type(frame, FrameType::HEALTH_RESULT);
  PayloadReader reader(frame.payload);

  node::NodeStatus status;
  status.node_id = reader.read_string();
  status.alive = reader.read_u8() != 0;
  status.free_bytes = reader.read_u64();
  status.total_bytes = reader.read_u64();
  reader.expect_end();
  return status;
}


//==============================================
// ERRORS
//==============================================

MessageFrame make_error(node::StatusCode code, const std::string& message) {
  PayloadWriter writer;
  writer.write_u8(static_cast<uint8_t>(code));
  writer.write_string(message);
  return make_frame(FrameType::ERROR, writer);
}

ErrorReply parse_error(const MessageFrame& frame) {
  expect_type(frame, FrameType::ERROR);
  PayloadReader reader(frame.payload);

  uint8_t code = reader.read_u8();
  if (!node::is_known_status_code(code)) {
    throw ProtocolError("Messages: Unknown status code " + std::to_string(code));
  }

  ErrorReply reply;
  reply.code = static_cast<node::StatusCode>(code);
  reply.message = reader.read_string();
  reader.expect_end();
  return reply;
}

} // namespace rpc
} // namespace vault
