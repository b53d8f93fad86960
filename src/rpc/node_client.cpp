#include "rpc/node_client.hpp"
#include "rpc/messages.hpp"
#include "node/status.hpp"
#include <vector>
#include <boost/asio/connect.hpp>
#include <boost/log/trivial.hpp>

namespace vault {
namespace rpc {

using boost::asio::ip::tcp;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

NodeClient::NodeClient(const std::string& host, uint16_t port, std::size_t max_frame_bytes)
  : host_(host)
  , port_(port)
  , codec_(max_frame_bytes) {}

NodeClient::~NodeClient() {
  close();
}


//==============================================
// CONNECTION MANAGEMENT
//==============================================

void NodeClient::connect() {
  if (is_connected()) {
    return;
  }

  tcp::resolver resolver(io_context_);
  auto endpoints = resolver.resolve(host_, std::to_string(port_));

  auto socket = std::make_unique<tcp::socket>(io_context_);
  boost::asio::connect(*socket, endpoints);
  socket_ = std::move(socket);

  BOOST_LOG_TRIVIAL(debug) << "Client: Connected to " << host_ << ":" << port_;
}

void NodeClient::close() {
  if (!socket_) {
    return;
  }
  boost::system::error_code ec;
  socket_->shutdown(tcp::socket::shutdown_both, ec);
  socket_->close(ec);
  socket_.reset();
}

bool NodeClient::is_connected() const {
  return socket_ && socket_->is_open();
}


//==============================================
// NODE CALLS
//==============================================

node::UploadResult NodeClient::upload(const node::UploadMetadata& metadata, std::istream& data,
                                      std::size_t chunk_size, uint32_t deadline_ms) {
  if (chunk_size == 0) {
    throw std::invalid_argument("Client: Chunk size must be positive");
  }
  connect();

  UploadOpening opening;
  opening.deadline_ms = deadline_ms;
  opening.metadata = metadata;

  // The node may give up mid-stream and close. Its ERROR frame is then
  // waiting in the receive buffer, so a failed send still reads the reply.
  try {
    send_frame(make_upload_metadata(opening));

    std::vector<char> buffer(chunk_size);
    while (data) {
      data.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
      std::streamsize count = data.gcount();
      if (count > 0) {
        send_frame(make_upload_chunk(buffer.data(), static_cast<std::size_t>(count)));
      }
    }
    send_frame(make_upload_end());
  }
  catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(debug) << "Client: Upload stream interrupted: " << e.what();
  }

  return parse_upload_result(expect_reply(FrameType::UPLOAD_RESULT));
}

uint64_t NodeClient::download(const node::ObjectTarget& target, std::ostream& output, uint32_t deadline_ms) {
  connect();

  TargetRequest request;
  request.deadline_ms = deadline_ms;
  request.target = target;
  send_frame(make_target_request(FrameType::DOWNLOAD_REQUEST, request));

  uint64_t received = 0;
  while (true) {
    MessageFrame frame = read_frame();

    if (frame.type == FrameType::DOWNLOAD_CHUNK) {
      output.write(frame.payload.data(), static_cast<std::streamsize>(frame.payload.size()));
      if (!output) {
        close();
        throw std::runtime_error("Client: Failed to write downloaded data");
      }
      received += frame.payload.size();
    }
    else if (frame.type == FrameType::DOWNLOAD_END) {
      uint64_t total = parse_download_end(frame);
      if (total != received) {
        close();
        throw ProtocolError("Client: Download ended after " + std::to_string(received) +
                            " bytes but the node reported " + std::to_string(total));
      }
      return total;
    }
    else if (frame.type == FrameType::ERROR) {
      raise_error(frame);
    }
    else {
      close();
      throw ProtocolError("Client: Unexpected " + frame_type_to_string(frame.type) + " during download");
    }
  }
}

bool NodeClient::remove(const node::ObjectTarget& target, uint32_t deadline_ms) {
  connect();

  TargetRequest request;
  request.deadline_ms = deadline_ms;
  request.target = target;
  send_frame(make_target_request(FrameType::DELETE_REQUEST, request));

  return parse_delete_result(expect_reply(FrameType::DELETE_RESULT));
}

node::NodeStatus NodeClient::health() {
  connect();
  send_frame(make_health_request());
  return parse_health_result(expect_reply(FrameType::HEALTH_RESULT));
}


//==============================================
// RAW FRAMES
//==============================================

void NodeClient::send_frame(const MessageFrame& frame) {
  if (!is_connected()) {
    throw std::runtime_error("Client: Not connected");
  }
  codec_.write_frame(*socket_, frame);
}

MessageFrame NodeClient::read_frame() {
  if (!is_connected()) {
    throw std::runtime_error("Client: Not connected");
  }
  return codec_.read_frame(*socket_);
}


//==============================================
// REPLY HANDLING
//==============================================

MessageFrame NodeClient::expect_reply(FrameType expected) {
  MessageFrame frame = read_frame();
  if (frame.type == FrameType::ERROR) {
    raise_error(frame);
  }
  if (frame.type != expected) {
    close();
    throw ProtocolError("Client: Expected " + frame_type_to_string(expected) + " but got " +
                        frame_type_to_string(frame.type));
  }
  return frame;
}

void NodeClient::raise_error(const MessageFrame& frame) {
  ErrorReply reply = parse_error(frame);
  // The node closes the connection after reporting a fault
  close();
  throw node::RpcError(reply.code, reply.message);
}

} // namespace rpc
} // namespace vault
