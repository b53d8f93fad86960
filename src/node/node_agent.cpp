#include "node/node_agent.hpp"
#include <csignal>
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>

namespace vault {
namespace node {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

NodeAgent::NodeAgent(const config::NodeConfig& config)
  : config_(config)
  , blocking_pool_(config.io_worker_threads) {
  BOOST_LOG_TRIVIAL(info) << "Node agent: Initializing node " << config_.node_id
                          << " (" << config_.node_name << ")";

  try {
    store_ = std::make_unique<storage::LocalFileStore>(blocking_pool_);
    service_ = std::make_unique<NodeService>(config_, io_context_, *store_);
    server_ = std::make_unique<rpc::NodeServer>(io_context_, *service_, config_.listen_address,
                                                config_.port, config_.max_frame_bytes);
    BOOST_LOG_TRIVIAL(debug) << "Node agent: Created all components";
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Node agent: Failed to initialize components: " << e.what();
    blocking_pool_.join();
    throw;
  }
}

NodeAgent::~NodeAgent() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool NodeAgent::start() {
  if (io_thread_) {
    BOOST_LOG_TRIVIAL(warning) << "Node agent: Already started";
    return false;
  }

  if (!server_->start()) {
    return false;
  }

  signals_ = std::make_unique<boost::asio::signal_set>(io_context_, SIGINT, SIGTERM);
  signals_->async_wait([this](const boost::system::error_code& ec, int signal_number) {
    if (!ec) {
      BOOST_LOG_TRIVIAL(info) << "Node agent: Received signal " << signal_number << ", stopping";
      stop_serving();
    }
  });

  io_thread_ = std::make_unique<std::thread>([this]() { run_io(); });
  BOOST_LOG_TRIVIAL(info) << "Node agent: Node " << config_.node_id << " serving on port " << port();
  return true;
}

void NodeAgent::shutdown() {
  if (io_thread_) {
    boost::asio::post(io_context_, [this]() { stop_serving(); });
  }
  wait();
}

void NodeAgent::wait() {
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
    BOOST_LOG_TRIVIAL(info) << "Node agent: I/O thread stopped";
  }
  blocking_pool_.join();
}


//==============================================
// I/O THREAD
//==============================================

void NodeAgent::run_io() {
  // run() returns once the listener, the signal wait and every call are done
  while (true) {
    try {
      io_context_.run();
      break;
    }
    catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Node agent: Unhandled error on the I/O thread: " << e.what();
    }
  }
}

void NodeAgent::stop_serving() {
  server_->shutdown();
  if (signals_) {
    boost::system::error_code ec;
    signals_->cancel(ec);
  }
}

} // namespace node
} // namespace vault
