#ifndef VAULT_RPC_NODE_SERVER_HPP
#define VAULT_RPC_NODE_SERVER_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/spawn.hpp>
#include "node/node_service.hpp"
#include "rpc/codec.hpp"

namespace vault {
namespace rpc {

// Accepts framed TCP connections and serves node calls on them, one call at
// a time per connection. Each connection runs as a coroutine on the given
// io_context. A call is cancelled when its client disconnects or its
// deadline passes.
class NodeServer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  NodeServer(boost::asio::io_context& io_context, node::NodeService& service,
             const std::string& address, uint16_t port, std::size_t max_frame_bytes);
  ~NodeServer();

  NodeServer(const NodeServer&) = delete;
  NodeServer& operator=(const NodeServer&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Binds the listener and starts accepting once the io_context runs
  bool start();
  // Stops accepting, cancels in-flight calls and closes every connection.
  // Safe to call from any thread; the work happens on the io_context.
  void shutdown();


  // ---- GETTERS ----
  // Bound port, useful when the configured port was 0
  uint16_t port() const { return bound_port_; }
  bool is_running() const { return is_running_; }
  std::size_t connection_count() const { return connections_.size(); }

private:
  class Connection;

  // ---- PARAMETERS ----
  boost::asio::io_context& io_context_;
  node::NodeService& service_;
  const std::string address_;
  const uint16_t port_;
  Codec codec_;

  std::atomic<bool> is_running_;
  std::atomic<uint16_t> bound_port_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::set<std::shared_ptr<Connection>> connections_;


  // ---- CONNECTION HANDLING ----
  void accept_loop(boost::asio::yield_context yield);
  void close_all();
};

} // namespace rpc
} // namespace vault

#endif // VAULT_RPC_NODE_SERVER_HPP
