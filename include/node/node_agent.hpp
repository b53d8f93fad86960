#ifndef VAULT_NODE_NODE_AGENT_HPP
#define VAULT_NODE_NODE_AGENT_HPP

#include <cstdint>
#include <memory>
#include <thread>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>
#include "config/node_config.hpp"
#include "node/node_service.hpp"
#include "rpc/node_server.hpp"
#include "storage/local_file_store.hpp"

namespace vault {
namespace node {

// Composition root of a running node: one I/O thread driving every call,
// a thread pool for blocking file work, the service and its TCP server
class NodeAgent {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Expects a configuration that already passed validate()
  explicit NodeAgent(const config::NodeConfig& config);
  ~NodeAgent();

  NodeAgent(const NodeAgent&) = delete;
  NodeAgent& operator=(const NodeAgent&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Starts the listener and the I/O thread. SIGINT and SIGTERM stop the node.
  bool start();
  // Stops serving and waits for in-flight calls to unwind
  void shutdown();
  // Blocks until the node has stopped
  void wait();


  // ---- GETTERS ----
  uint16_t port() const { return server_->port(); }
  NodeService& get_service() { return *service_; }

private:
  // ---- PARAMETERS ----
  config::NodeConfig config_;
  boost::asio::io_context io_context_;
  boost::asio::thread_pool blocking_pool_;

  // System components
  std::unique_ptr<storage::LocalFileStore> store_;
  std::unique_ptr<NodeService> service_;
  std::unique_ptr<rpc::NodeServer> server_;
  std::unique_ptr<boost::asio::signal_set> signals_;
  std::unique_ptr<std::thread> io_thread_;


  // ---- I/O THREAD ----
  void run_io();
  // Runs on the I/O thread
  void stop_serving();
};

} // namespace node
} // namespace vault

#endif // VAULT_NODE_NODE_AGENT_HPP
