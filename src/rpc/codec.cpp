#include "rpc/codec.hpp"
#include <cstring>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <boost/log/trivial.hpp>

namespace vault {
namespace rpc {

//==============================================
// FRAME TYPES
//==============================================

std::string frame_type_to_string(FrameType type) {
  switch (type) {
    case FrameType::UPLOAD_METADATA:  return "UPLOAD_METADATA";
    case FrameType::UPLOAD_CHUNK:     return "UPLOAD_CHUNK";
    case FrameType::UPLOAD_END:       return "UPLOAD_END";
    case FrameType::UPLOAD_RESULT:    return "UPLOAD_RESULT";
    case FrameType::DOWNLOAD_REQUEST: return "DOWNLOAD_REQUEST";
    case FrameType::DOWNLOAD_CHUNK:   return "DOWNLOAD_CHUNK";
    case FrameType::DOWNLOAD_END:     return "DOWNLOAD_END";
    case FrameType::DELETE_REQUEST:   return "DELETE_REQUEST";
    case FrameType::DELETE_RESULT:    return "DELETE_RESULT";
    case FrameType::HEALTH_REQUEST:   return "HEALTH_REQUEST";
    case FrameType::HEALTH_RESULT:    return "HEALTH_RESULT";
    case FrameType::ERROR:            return "ERROR";
    default:                          return "UNKNOWN";
  }
}

bool is_known_frame_type(uint8_t value) {
  return frame_type_to_string(static_cast<FrameType>(value)) != "UNKNOWN";
}


//==============================================
// PAYLOAD WRITER
//==============================================

void PayloadWriter::write_u8(uint8_t value) {
  write_bytes(&value, sizeof(value));
}

void PayloadWriter::write_u32(uint32_t value) {
  uint32_t network_value = boost::endian::native_to_big(value);
  write_bytes(&network_value, sizeof(network_value));
}

void PayloadWriter::write_u64(uint64_t value) {
  uint64_t network_value = boost::endian::native_to_big(value);
  write_bytes(&network_value, sizeof(network_value));
}

void PayloadWriter::write_string(const std::string& value) {
  if (value.size() > UINT32_MAX) {
    throw ProtocolError("Codec: String field too long");
  }
  write_u32(static_cast<uint32_t>(value.size()));
  write_bytes(value.data(), value.size());
}

void PayloadWriter::write_bytes(const void* data, std::size_t size) {
  const char* bytes = static_cast<const char*>(data);
  data_.insert(data_.end(), bytes, bytes + size);
}


//==============================================
// PAYLOAD READER
//==============================================

uint8_t PayloadReader::read_u8() {
  uint8_t value;
  read_bytes(&value, sizeof(value));
  return value;
}

uint32_t PayloadReader::read_u32() {
  uint32_t network_value;
  read_bytes(&network_value, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

uint64_t PayloadReader::read_u64() {
  uint64_t network_value;
  read_bytes(&network_value, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

std::string PayloadReader::read_string() {
  uint32_t length = read_u32();
  if (length > data_.size() - offset_) {
    throw ProtocolError("Codec: String field runs past the end of the payload");
  }
  std::string value(data_.data() + offset_, length);
  offset_ += length;
  return value;
}

void PayloadReader::expect_end() const {
  if (!at_end()) {
    throw ProtocolError("Codec: " + std::to_string(data_.size() - offset_) + " unexpected trailing bytes");
  }
}

void PayloadReader::read_bytes(void* out, std::size_t size) {
  if (size > data_.size() - offset_) {
    throw ProtocolError("Codec: Payload too short");
  }
  std::memcpy(out, data_.data() + offset_, size);
  offset_ += size;
}


//==============================================
// CONSTRUCTOR
//==============================================

Codec::Codec(std::size_t max_frame_bytes) : max_frame_bytes_(max_frame_bytes) {
  if (max_frame_bytes_ == 0 || max_frame_bytes_ > UINT32_MAX) {
    throw std::invalid_argument("Codec: Maximum frame size must be between 1 and 4 GiB");
  }
}


//==============================================
// SERIALIZATION AND DESERIALIZATION
//==============================================

std::size_t Codec::serialize(const MessageFrame& frame, std::ostream& output) const {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid output stream state";
    throw std::runtime_error("Codec: Invalid output stream");
  }

  Header header = encode_header(frame);
  if (!output.write(header.data(), header.size()) ||
      !output.write(frame.payload.data(), frame.payload.size())) {
    throw std::runtime_error("Codec: Failed to write to output stream");
  }
  output.flush();

  BOOST_LOG_TRIVIAL(trace) << "Codec: Serialized " << frame_type_to_string(frame.type)
                           << " with " << frame.payload.size() << " payload bytes";
  return header.size() + frame.payload.size();
}

MessageFrame Codec::deserialize(std::istream& input) const {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid input stream state";
    throw std::runtime_error("Codec: Invalid input stream");
  }

  Header header;
  if (!input.read(header.data(), header.size())) {
    throw std::runtime_error("Codec: Failed to read frame header from input stream");
  }

  MessageFrame frame;
  uint32_t length = decode_header(header, frame.type);
  frame.payload.resize(length);
  if (length > 0 && !input.read(frame.payload.data(), length)) {
    throw std::runtime_error("Codec: Failed to read frame payload from input stream");
  }
  return frame;
}


//==============================================
// SOCKET TRANSPORT
//==============================================

void Codec::write_frame(boost::asio::ip::tcp::socket& socket, const MessageFrame& frame,
                        boost::asio::yield_context yield) const {
  Header header = encode_header(frame);
  std::array<boost::asio::const_buffer, 2> buffers = {
    boost::asio::buffer(header),
    boost::asio::buffer(frame.payload)
  };
  boost::asio::async_write(socket, buffers, yield);
}

MessageFrame Codec::read_frame(boost::asio::ip::tcp::socket& socket, boost::asio::yield_context yield) const {
  Header header;
  boost::asio::async_read(socket, boost::asio::buffer(header), yield);

  MessageFrame frame;
  uint32_t length = decode_header(header, frame.type);
  frame.payload.resize(length);
  if (length > 0) {
    boost::asio::async_read(socket, boost::asio::buffer(frame.payload), yield);
  }
  return frame;
}

void Codec::write_frame(boost::asio::ip::tcp::socket& socket, const MessageFrame& frame) const {
  Header header = encode_header(frame);
  std::array<boost::asio::const_buffer, 2> buffers = {
    boost::asio::buffer(header),
    boost::asio::buffer(frame.payload)
  };
  boost::asio::write(socket, buffers);
}

MessageFrame Codec::read_frame(boost::asio::ip::tcp::socket& socket) const {
  Header header;
  boost::asio::read(socket, boost::asio::buffer(header));

  MessageFrame frame;
  uint32_t length = decode_header(header, frame.type);
  frame.payload.resize(length);
  if (length > 0) {
    boost::asio::read(socket, boost::asio::buffer(frame.payload));
  }
  return frame;
}


//==============================================
// HEADER HANDLING
//==============================================

Codec::Header Codec::encode_header(const MessageFrame& frame) const {
  if (frame.payload.size() > max_frame_bytes_) {
    throw ProtocolError("Codec: " + frame_type_to_string(frame.type) + " payload of " +
                        std::to_string(frame.payload.size()) + " bytes exceeds the frame limit");
  }

  Header header;
  header[0] = static_cast<char>(frame.type);
  uint32_t network_length = to_network_order(static_cast<uint32_t>(frame.payload.size()));
  std::memcpy(header.data() + 1, &network_length, sizeof(network_length));
  return header;
}

uint32_t Codec::decode_header(const Header& header, FrameType& type) const {
  uint8_t tag = static_cast<uint8_t>(header[0]);
  if (!is_known_frame_type(tag)) {
    throw ProtocolError("Codec: Unknown frame type " + std::to_string(tag));
  }
  type = static_cast<FrameType>(tag);

  uint32_t network_length;
  std::memcpy(&network_length, header.data() + 1, sizeof(network_length));
  uint32_t length = from_network_order(network_length);
  if (length > max_frame_bytes_) {
    throw ProtocolError("Codec: Frame of " + std::to_string(length) + " bytes exceeds the limit of " +
                        std::to_string(max_frame_bytes_));
  }
  return length;
}

} // namespace rpc
} // namespace vault
