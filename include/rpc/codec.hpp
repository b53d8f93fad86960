#ifndef VAULT_RPC_CODEC_HPP
#define VAULT_RPC_CODEC_HPP

#include <array>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/endian/conversion.hpp>
#include "rpc/message_frame.hpp"

namespace vault {
namespace rpc {

// Malformed frame or payload
class ProtocolError : public std::runtime_error {
public:
  explicit ProtocolError(const std::string& message) : std::runtime_error(message) {}
};

// Appends big-endian integers and length-prefixed strings to a payload
class PayloadWriter {
public:
  void write_u8(uint8_t value);
  void write_u32(uint32_t value);
  void write_u64(uint64_t value);
  // u32 length followed by the bytes
  void write_string(const std::string& value);

  std::vector<char>& data() { return data_; }

private:
  std::vector<char> data_;

  void write_bytes(const void* data, std::size_t size);
};

// Reads fields back in the order they were written. Throws ProtocolError
// when the payload is too short.
class PayloadReader {
public:
  explicit PayloadReader(const std::vector<char>& data) : data_(data) {}

  uint8_t read_u8();
  uint32_t read_u32();
  uint64_t read_u64();
  std::string read_string();

  bool at_end() const { return offset_ == data_.size(); }
  // Throws ProtocolError when bytes are left over
  void expect_end() const;

private:
  const std::vector<char>& data_;
  std::size_t offset_ = 0;

  void read_bytes(void* out, std::size_t size);
};

// Frames messages onto byte streams and sockets. Rejects unknown frame types
// and frames larger than max_frame_bytes in both directions.
class Codec {
public:
  // ---- CONSTRUCTOR ----
  explicit Codec(std::size_t max_frame_bytes = DEFAULT_MAX_FRAME_BYTES);


  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Writes a frame to an output stream and returns the bytes written
  std::size_t serialize(const MessageFrame& frame, std::ostream& output) const;
  // Reads one frame from an input stream
  MessageFrame deserialize(std::istream& input) const;


  // ---- SOCKET TRANSPORT ----
  // Coroutine variants; socket errors are thrown as boost::system::system_error
  void write_frame(boost::asio::ip::tcp::socket& socket, const MessageFrame& frame,
                   boost::asio::yield_context yield) const;
  MessageFrame read_frame(boost::asio::ip::tcp::socket& socket, boost::asio::yield_context yield) const;
  // Blocking variants for clients
  void write_frame(boost::asio::ip::tcp::socket& socket, const MessageFrame& frame) const;
  MessageFrame read_frame(boost::asio::ip::tcp::socket& socket) const;

  std::size_t max_frame_bytes() const { return max_frame_bytes_; }

private:
  using Header = std::array<char, FRAME_HEADER_SIZE>;

  // ---- PARAMETERS ----
  std::size_t max_frame_bytes_;


  // ---- HEADER HANDLING ----
  Header encode_header(const MessageFrame& frame) const;
  // Validates the type tag and the size limit, returning the payload length
  uint32_t decode_header(const Header& header, FrameType& type) const;


  // ---- HOST TO NETWORK BYTE ORDER CONVERSION ----
  static uint32_t to_network_order(uint32_t host_value) {
    return boost::endian::native_to_big(host_value);
  }
  static uint32_t from_network_order(uint32_t network_value) {
    return boost::endian::big_to_native(network_value);
  }
};

} // namespace rpc
} // namespace vault

#endif // VAULT_RPC_CODEC_HPP
