#include "rpc/node_server.hpp"
#include "rpc/messages.hpp"
#include "node/status.hpp"
#include "sync/cancellation.hpp"
#include <chrono>
#include <optional>
#include <utility>
#include <poll.h>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/log/trivial.hpp>

namespace vault {
namespace rpc {

using boost::asio::ip::tcp;

namespace {

struct Failure {
  node::StatusCode code;
  std::string message;
};

// Per-call state. Cancelling the signal aborts pending socket operations so
// a coroutine blocked on the peer wakes up.
struct Call {
  Call(boost::asio::io_context& io_context, const std::shared_ptr<tcp::socket>& socket)
    : cancel(std::make_shared<sync::CancellationSignal>())
    , deadline(std::make_shared<boost::asio::steady_timer>(io_context)) {
    abort_io = cancel->on_cancel([socket]() {
      boost::system::error_code ec;
      socket->cancel(ec);
    });
  }

  void arm_deadline(uint32_t deadline_ms) {
    if (deadline_ms == 0) {
      return;
    }
    deadline->expires_after(std::chrono::milliseconds(deadline_ms));
    deadline->async_wait([signal = cancel](const boost::system::error_code& ec) {
      if (!ec) {
        signal->cancel(sync::CancelReason::DEADLINE);
      }
    });
  }

  std::shared_ptr<sync::CancellationSignal> cancel;
  std::shared_ptr<boost::asio::steady_timer> deadline;
  sync::CancellationSignal::Registration abort_io;
};

// Watches an idle socket during a call and cancels the call if the peer
// hangs up
struct DisconnectWatch {
  explicit DisconnectWatch(boost::asio::io_context& io_context) : done(io_context), poll(io_context) {
    done.expires_at(boost::asio::steady_timer::time_point::max());
  }

  bool active = true;
  bool finished = false;
  boost::asio::steady_timer done;
  boost::asio::steady_timer poll;
};

// Interval for hangup checks once unread call data sits in the socket
constexpr std::chrono::milliseconds HANGUP_POLL_INTERVAL(50);

// True once the peer closed its side, even with unread data still buffered
bool peer_hung_up(tcp::socket& socket) {
  pollfd descriptor{};
  descriptor.fd = socket.native_handle();
  descriptor.events = POLLRDHUP;
  if (::poll(&descriptor, 1, 0) <= 0) {
    return false;
  }
  return (descriptor.revents & (POLLRDHUP | POLLHUP | POLLERR | POLLNVAL)) != 0;
}

} // namespace

//==============================================
// CONNECTION
//==============================================

class NodeServer::Connection {
public:
  Connection(boost::asio::io_context& io_context, std::shared_ptr<tcp::socket> socket,
             node::NodeService& service, const Codec& codec)
    : io_context_(io_context)
    , socket_(std::move(socket))
    , service_(service)
    , codec_(codec) {
    boost::system::error_code ec;
    auto endpoint = socket_->remote_endpoint(ec);
    peer_ = ec ? std::string("unknown peer") : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
  }

  // Serves calls until the peer leaves, a call faults or the server closes us
  void serve(boost::asio::yield_context yield) {
    BOOST_LOG_TRIVIAL(info) << "Server: Connection from " << peer_;

    while (!closed_) {
      MessageFrame frame;
      bool have_frame = false;
      std::optional<Failure> failure;

      try {
        frame = codec_.read_frame(*socket_, yield);
        have_frame = true;
      }
      catch (const ProtocolError& e) {
        failure = Failure{node::StatusCode::INVALID_ARGUMENT, e.what()};
      }
      catch (const boost::system::system_error& e) {
        if (e.code() != boost::asio::error::eof && !closed_) {
          BOOST_LOG_TRIVIAL(debug) << "Server: Read from " << peer_ << " ended: " << e.code().message();
        }
      }

      if (failure) {
        BOOST_LOG_TRIVIAL(warning) << "Server: Bad frame from " << peer_ << ": " << failure->message;
        send_error(*failure, yield);
        break;
      }
      if (!have_frame || !dispatch(std::move(frame), yield)) {
        break;
      }
    }

    close();
    BOOST_LOG_TRIVIAL(info) << "Server: Connection from " << peer_ << " closed";
  }

  // Cancels the running call and closes the socket
  void close() {
    closed_ = true;
    if (auto cancel = current_cancel_.lock()) {
      cancel->cancel(sync::CancelReason::CLIENT);
    }
    boost::system::error_code ec;
    socket_->shutdown(tcp::socket::shutdown_both, ec);
    socket_->close(ec);
  }

  // ---- CANCELLATION AWARE SOCKET I/O ----
  MessageFrame read_frame(Call& call, boost::asio::yield_context yield) {
    try {
      return codec_.read_frame(*socket_, yield);
    }
    catch (const ProtocolError& e) {
      throw node::RpcError(node::StatusCode::INVALID_ARGUMENT, e.what());
    }
    catch (const boost::system::system_error& e) {
      throw_socket_failure(call, e, false);
    }
  }

  void write_frame(const MessageFrame& frame, Call& call, boost::asio::yield_context yield) {
    try {
      codec_.write_frame(*socket_, frame, yield);
    }
    catch (const boost::system::system_error& e) {
      throw_socket_failure(call, e, true);
    }
  }

private:
  class FrameUploadStream;
  class FrameChunkSink;

  boost::asio::io_context& io_context_;
  std::shared_ptr<tcp::socket> socket_;
  node::NodeService& service_;
  const Codec& codec_;
  std::string peer_;
  bool closed_ = false;
  bool broken_ = false;       // Peer gone or a reply cut off, no ERROR can follow
  std::weak_ptr<sync::CancellationSignal> current_cancel_;

  bool dispatch(MessageFrame frame, boost::asio::yield_context yield);
  void handle_upload(MessageFrame frame, Call& call, boost::asio::yield_context yield);
  void handle_download(const MessageFrame& frame, Call& call, boost::asio::yield_context yield);
  void handle_delete(const MessageFrame& frame, Call& call, boost::asio::yield_context yield);
  void handle_health(Call& call, boost::asio::yield_context yield);

  std::shared_ptr<DisconnectWatch> start_watch(Call& call);
  void stop_watch(const std::shared_ptr<DisconnectWatch>& watch, boost::asio::yield_context yield);
  void send_error(const Failure& failure, boost::asio::yield_context yield);

  // A read aborted by our own cancellation leaves the outbound side intact
  [[noreturn]] void throw_socket_failure(Call& call, const boost::system::system_error& e, bool writing) {
    if (writing || e.code() != boost::asio::error::operation_aborted) {
      broken_ = true;
    }
    if (!call.cancel->is_cancelled()) {
      BOOST_LOG_TRIVIAL(debug) << "Server: Lost " << peer_ << " mid-call: " << e.code().message();
      call.cancel->cancel(sync::CancelReason::CLIENT);
    }
    throw sync::OperationCancelled(call.cancel->reason());
  }
};

// Upload frames as seen by the coordinator
class NodeServer::Connection::FrameUploadStream : public node::UploadStream {
public:
  FrameUploadStream(Connection& connection, Call& call, std::shared_ptr<DisconnectWatch> watch,
                    std::optional<node::UploadUnit> first, bool ended)
    : connection_(connection)
    , call_(call)
    , watch_(std::move(watch))
    , first_(std::move(first))
    , ended_(ended) {}

  bool next(node::UploadUnit& unit, boost::asio::yield_context yield) override {
    if (first_) {
      unit = std::move(*first_);
      first_.reset();
      return true;
    }
    if (ended_) {
      return false;
    }
    release_watch(yield);
    return to_unit(connection_.read_frame(call_, yield), unit);
  }

  // Discards the rest of a rejected upload so the connection stays usable
  void drain(boost::asio::yield_context yield) {
    first_.reset();
    release_watch(yield);
    node::UploadUnit unit;
    while (!ended_) {
      to_unit(connection_.read_frame(call_, yield), unit);
    }
  }

  // Hands the socket back from the disconnect watch to the frame reader
  void release_watch(boost::asio::yield_context yield) {
    if (watch_) {
      connection_.stop_watch(watch_, yield);
      watch_.reset();
    }
  }

private:
  Connection& connection_;
  Call& call_;
  std::shared_ptr<DisconnectWatch> watch_;
  std::optional<node::UploadUnit> first_;
  bool ended_;

  bool to_unit(MessageFrame frame, node::UploadUnit& unit) {
    switch (frame.type) {
      case FrameType::UPLOAD_METADATA:
        unit.kind = node::UploadUnit::Kind::METADATA;
        unit.chunk.clear();
        try {
          unit.metadata = parse_upload_metadata(frame).metadata;
        }
        catch (const ProtocolError& e) {
          throw node::RpcError(node::StatusCode::INVALID_ARGUMENT, e.what());
        }
        return true;

      case FrameType::UPLOAD_CHUNK:
        unit.kind = node::UploadUnit::Kind::CHUNK;
        unit.chunk = std::move(frame.payload);
        return true;

      case FrameType::UPLOAD_END:
        ended_ = true;
        return false;

      default:
        throw node::RpcError(node::StatusCode::INVALID_ARGUMENT,
                             "Unexpected " + frame_type_to_string(frame.type) + " during upload");
    }
  }
};

class NodeServer::Connection::FrameChunkSink : public node::ChunkSink {
public:
  FrameChunkSink(Connection& connection, Call& call)
    : connection_(connection), call_(call) {}

  void write(const std::vector<char>& chunk, boost::asio::yield_context yield) override {
    connection_.write_frame(make_download_chunk(chunk), call_, yield);
  }

private:
  Connection& connection_;
  Call& call_;
};

bool NodeServer::Connection::dispatch(MessageFrame frame, boost::asio::yield_context yield) {
  Call call(io_context_, socket_);
  current_cancel_ = call.cancel;
  const FrameType type = frame.type;
  std::optional<Failure> failure;

  try {
    switch (type) {
      case FrameType::UPLOAD_METADATA:
      case FrameType::UPLOAD_CHUNK:
      case FrameType::UPLOAD_END:
        handle_upload(std::move(frame), call, yield);
        break;
      case FrameType::DOWNLOAD_REQUEST:
        handle_download(frame, call, yield);
        break;
      case FrameType::DELETE_REQUEST:
        handle_delete(frame, call, yield);
        break;
      case FrameType::HEALTH_REQUEST:
        handle_health(call, yield);
        break;
      default:
        throw node::RpcError(node::StatusCode::INVALID_ARGUMENT,
                             "Unexpected " + frame_type_to_string(type) + " at the start of a call");
    }
  }
  catch (const node::RpcError& e) {
    failure = Failure{e.code(), e.what()};
  }
  catch (const ProtocolError& e) {
    failure = Failure{node::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  catch (const sync::OperationCancelled& e) {
    failure = Failure{node::status_for_cancel(e.reason()), e.what()};
  }
  catch (const std::exception& e) {
    failure = Failure{node::StatusCode::INTERNAL, e.what()};
  }

  current_cancel_.reset();
  if (!failure) {
    return true;
  }

  BOOST_LOG_TRIVIAL(warning) << "Server: " << frame_type_to_string(type) << " call from " << peer_
                             << " failed with " << failure->code << ": " << failure->message;
  send_error(*failure, yield);
  return false;
}

void NodeServer::Connection::handle_upload(MessageFrame frame, Call& call, boost::asio::yield_context yield) {
  std::optional<node::UploadUnit> first;
  bool ended = false;

  if (frame.type == FrameType::UPLOAD_METADATA) {
    UploadOpening opening = parse_upload_metadata(frame);
    call.arm_deadline(opening.deadline_ms);
    first.emplace();
    first->kind = node::UploadUnit::Kind::METADATA;
    first->metadata = std::move(opening.metadata);
  }
  else if (frame.type == FrameType::UPLOAD_CHUNK) {
    first.emplace();
    first->kind = node::UploadUnit::Kind::CHUNK;
    first->chunk = std::move(frame.payload);
  }
  else {
    ended = true;
  }

  // Slot and key lock waits happen before the coordinator reads the socket
  FrameUploadStream stream(*this, call, start_watch(call), std::move(first), ended);
  std::exception_ptr error;
  node::UploadResult result;

  try {
    result = service_.upload(stream, *call.cancel, yield);
  }
  catch (const std::exception&) {
    error = std::current_exception();
  }

  stream.release_watch(yield);
  if (error) {
    std::rethrow_exception(error);
  }
  if (!result.success) {
    stream.drain(yield);
  }
  write_frame(make_upload_result(result), call, yield);
}

void NodeServer::Connection::handle_download(const MessageFrame& frame, Call& call,
                                             boost::asio::yield_context yield) {
  TargetRequest request = parse_target_request(frame);
  call.arm_deadline(request.deadline_ms);

  FrameChunkSink sink(*this, call);
  auto watch = start_watch(call);
  std::exception_ptr error;
  uint64_t total = 0;

  try {
    total = service_.download(request.target, sink, *call.cancel, yield);
  }
  catch (const std::exception&) {
    // Rethrown once the watcher has stopped
    error = std::current_exception();
  }

  stop_watch(watch, yield);
  if (error) {
    std::rethrow_exception(error);
  }
  write_frame(make_download_end(total), call, yield);
}

void NodeServer::Connection::handle_delete(const MessageFrame& frame, Call& call,
                                           boost::asio::yield_context yield) {
  TargetRequest request = parse_target_request(frame);
  call.arm_deadline(request.deadline_ms);

  auto watch = start_watch(call);
  std::exception_ptr error;
  bool deleted = false;

  try {
    deleted = service_.remove(request.target, *call.cancel, yield);
  }
  catch (const std::exception&) {
    error = std::current_exception();
  }

  stop_watch(watch, yield);
  if (error) {
    std::rethrow_exception(error);
  }
  write_frame(make_delete_result(deleted), call, yield);
}

void NodeServer::Connection::handle_health(Call& call, boost::asio::yield_context yield) {
  node::NodeStatus status = service_.health(yield);
  write_frame(make_health_result(status), call, yield);
}

std::shared_ptr<DisconnectWatch> NodeServer::Connection::start_watch(Call& call) {
  auto watch = std::make_shared<DisconnectWatch>(io_context_);

  boost::asio::spawn(io_context_, [socket = socket_, signal = call.cancel, watch](boost::asio::yield_context yield) {
    if (watch->active) {
      boost::system::error_code ec;
      socket->async_wait(tcp::socket::wait_read, yield[ec]);

      // Readable with nothing to read means the peer closed its side
      boost::system::error_code available_ec;
      if (watch->active && (ec || socket->available(available_ec) == 0 || available_ec)) {
        signal->cancel(sync::CancelReason::CLIENT);
      }
      // Pipelined upload data is waiting, keep checking for a hangup behind it
      while (watch->active && !signal->is_cancelled()) {
        watch->poll.expires_after(HANGUP_POLL_INTERVAL);
        watch->poll.async_wait(yield[ec]);
        if (watch->active && peer_hung_up(*socket)) {
          signal->cancel(sync::CancelReason::CLIENT);
        }
      }
    }
    watch->finished = true;
    watch->done.cancel();
  });

  return watch;
}

void NodeServer::Connection::stop_watch(const std::shared_ptr<DisconnectWatch>& watch,
                                        boost::asio::yield_context yield) {
  watch->active = false;
  if (!watch->finished) {
    boost::system::error_code ec;
    socket_->cancel(ec);
    watch->poll.cancel();
  }
  while (!watch->finished) {
    boost::system::error_code ec;
    watch->done.async_wait(yield[ec]);
  }
}

void NodeServer::Connection::send_error(const Failure& failure, boost::asio::yield_context yield) {
  if (broken_ || closed_) {
    return;
  }
  try {
    codec_.write_frame(*socket_, make_error(failure.code, failure.message), yield);
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(debug) << "Server: Could not report error to " << peer_ << ": " << e.what();
  }
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

NodeServer::NodeServer(boost::asio::io_context& io_context, node::NodeService& service,
                       const std::string& address, uint16_t port, std::size_t max_frame_bytes)
  : io_context_(io_context)
  , service_(service)
  , address_(address)
  , port_(port)
  , codec_(max_frame_bytes)
  , is_running_(false)
  , bound_port_(0) {
  BOOST_LOG_TRIVIAL(info) << "Server: Initializing on " << address << ":" << port;
}

NodeServer::~NodeServer() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "Server: Destroyed while running";
  }
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool NodeServer::start() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "Server: Already running";
    return false;
  }

  try {
    tcp::endpoint endpoint(boost::asio::ip::make_address(address_), port_);

    acceptor_ = std::make_unique<tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();
    bound_port_ = acceptor_->local_endpoint().port();

    is_running_ = true;
    boost::asio::spawn(io_context_, [this](boost::asio::yield_context yield) { accept_loop(yield); });

    BOOST_LOG_TRIVIAL(info) << "Server: Listening on " << address_ << ":" << bound_port_;
    return true;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Server: Failed to start listener: " << e.what();
    acceptor_.reset();
    return false;
  }
}

void NodeServer::shutdown() {
  if (!is_running_.exchange(false)) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Server: Initiating shutdown";
  boost::asio::post(io_context_, [this]() { close_all(); });
}


//==============================================
// CONNECTION HANDLING
//==============================================

void NodeServer::accept_loop(boost::asio::yield_context yield) {
  while (is_running_) {
    auto socket = std::make_shared<tcp::socket>(io_context_);
    boost::system::error_code ec;
    acceptor_->async_accept(*socket, yield[ec]);

    if (ec) {
      if (!is_running_ || ec == boost::asio::error::operation_aborted) {
        break;
      }
      BOOST_LOG_TRIVIAL(error) << "Server: Accept error: " << ec.message();
      continue;
    }

    auto connection = std::make_shared<Connection>(io_context_, socket, service_, codec_);
    connections_.insert(connection);

    boost::asio::spawn(io_context_, [this, connection](boost::asio::yield_context connection_yield) {
      try {
        connection->serve(connection_yield);
      }
      catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Server: Connection failed: " << e.what();
        connection->close();
      }
      connections_.erase(connection);
    });
  }
  BOOST_LOG_TRIVIAL(debug) << "Server: Accept loop finished";
}

void NodeServer::close_all() {
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Server: Error closing acceptor: " << ec.message();
    }
  }

  for (const auto& connection : connections_) {
    connection->close();
  }
  BOOST_LOG_TRIVIAL(info) << "Server: Shutdown complete, closed " << connections_.size() << " connection(s)";
}

} // namespace rpc
} // namespace vault
