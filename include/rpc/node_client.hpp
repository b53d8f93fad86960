#ifndef VAULT_RPC_NODE_CLIENT_HPP
#define VAULT_RPC_NODE_CLIENT_HPP

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include "node/types.hpp"
#include "rpc/codec.hpp"

namespace vault {
namespace rpc {

// Blocking client for one node connection. Calls reconnect on demand after
// the server closed the connection. Errors reported by the node are thrown as
// node::RpcError, malformed replies as ProtocolError and socket failures as
// boost::system::system_error.
class NodeClient {
public:
  static constexpr std::size_t DEFAULT_CHUNK_SIZE = 1024 * 1024;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  NodeClient(const std::string& host, uint16_t port,
             std::size_t max_frame_bytes = DEFAULT_MAX_FRAME_BYTES);
  ~NodeClient();

  NodeClient(const NodeClient&) = delete;
  NodeClient& operator=(const NodeClient&) = delete;


  // ---- CONNECTION MANAGEMENT ----
  void connect();
  void close();
  bool is_connected() const;


  // ---- NODE CALLS ----
  // Streams data in chunk_size pieces after the metadata. A deadline of 0
  // means none.
  node::UploadResult upload(const node::UploadMetadata& metadata, std::istream& data,
                            std::size_t chunk_size = DEFAULT_CHUNK_SIZE, uint32_t deadline_ms = 0);
  // Writes the object to output and returns the byte count
  uint64_t download(const node::ObjectTarget& target, std::ostream& output, uint32_t deadline_ms = 0);
  bool remove(const node::ObjectTarget& target, uint32_t deadline_ms = 0);
  node::NodeStatus health();


  // ---- RAW FRAMES ----
  void send_frame(const MessageFrame& frame);
  MessageFrame read_frame();

private:
  // ---- PARAMETERS ----
  std::string host_;
  uint16_t port_;
  Codec codec_;
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::socket> socket_;


  // ---- REPLY HANDLING ----
  // Reads the reply and checks its type, turning ERROR frames into RpcError
  MessageFrame expect_reply(FrameType expected);
  [[noreturn]] void raise_error(const MessageFrame& frame);
};

} // namespace rpc
} // namespace vault

#endif // VAULT_RPC_NODE_CLIENT_HPP
