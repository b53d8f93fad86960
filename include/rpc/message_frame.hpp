#ifndef VAULT_RPC_MESSAGE_FRAME_HPP
#define VAULT_RPC_MESSAGE_FRAME_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vault {
namespace rpc {

// Frame type tag, the first byte of every frame
enum class FrameType : uint8_t {
    UPLOAD_METADATA = 0x01,
    UPLOAD_CHUNK = 0x02,
    UPLOAD_END = 0x03,
    UPLOAD_RESULT = 0x04,
    DOWNLOAD_REQUEST = 0x10,
    DOWNLOAD_CHUNK = 0x11,
    DOWNLOAD_END = 0x12,
    DELETE_REQUEST = 0x20,
    DELETE_RESULT = 0x21,
    HEALTH_REQUEST = 0x30,
    HEALTH_RESULT = 0x31,
    ERROR = 0x7F
};

// Wire layout: type (u8) | payload length (u32, big-endian) | payload
constexpr std::size_t FRAME_HEADER_SIZE = 5;
constexpr std::size_t DEFAULT_MAX_FRAME_BYTES = 16 * 1024 * 1024;

struct MessageFrame {
    FrameType type = FrameType::ERROR;
    std::vector<char> payload;
};

std::string frame_type_to_string(FrameType type);
bool is_known_frame_type(uint8_t value);

} // namespace rpc
} // namespace vault

#endif // VAULT_RPC_MESSAGE_FRAME_HPP
