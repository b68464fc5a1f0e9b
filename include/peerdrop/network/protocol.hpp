#pragma once

#include <cstdint>
#include <array>
#include <string>
#include <vector>
#include <span>
#include <variant>
#include <concepts>

namespace peerdrop::network {

constexpr std::uint32_t PROTOCOL_MAGIC = 0x50445250; // "PDRP"
constexpr std::uint16_t PROTOCOL_VERSION = 1;
constexpr std::size_t FRAME_HEADER_SIZE = 16;
constexpr std::uint32_t MAX_FRAME_PAYLOAD = 16 * 1024 * 1024;

enum class FrameKind : std::uint8_t {
    CONTROL = 0x01,
    BINARY  = 0x02
};

enum class MessageType : std::uint8_t {
    NONE              = 0x00,
    REQUEST_INFO      = 0x01,
    PASSWORD_REQUIRED = 0x02,
    USE_PASSWORD      = 0x03,
    INFO              = 0x04,
    START             = 0x05,
    CHUNK             = 0x06,
    CHUNK_ACK         = 0x07,
    DONE              = 0x08,
    ERROR             = 0xFF
};

const char* to_string(MessageType type);

struct FrameHeader {
    std::uint32_t magic;           // Protocol magic number
    std::uint16_t version;         // Protocol version
    FrameKind kind;                // Control or binary frame
    MessageType type;              // Control message tag, NONE for binary
    std::uint32_t payload_size;    // Payload length in bytes
    std::array<std::uint8_t, 4> checksum; // CRC32 of payload
    
    FrameHeader();
    FrameHeader(FrameKind frame_kind, MessageType msg_type, std::uint32_t payload_len);
    
    bool is_valid() const;
    void calculate_checksum(std::span<const std::uint8_t> payload);
    bool verify_checksum(std::span<const std::uint8_t> payload) const;
    
    std::vector<std::uint8_t> serialize() const;
    static FrameHeader deserialize(std::span<const std::uint8_t> data);
};

template<typename T>
concept MessagePayload = requires(T t) {
    { T::TYPE } -> std::convertible_to<MessageType>;
    { t.serialize() } -> std::convertible_to<std::vector<std::uint8_t>>;
    { T::deserialize(std::declval<std::span<const std::uint8_t>>()) } -> std::same_as<T>;
};

// Describes the artifact being transferred. `size` is authoritative for
// completion detection on the receiving side.
struct FileInfo {
    std::string name;
    std::uint64_t size = 0;
    std::string mime_type;
    
    bool operator==(const FileInfo& other) const = default;
};

struct RequestInfoMessage {
    static constexpr MessageType TYPE = MessageType::REQUEST_INFO;
    
    std::string browser_name;
    std::string os_name;
    
    std::vector<std::uint8_t> serialize() const;
    static RequestInfoMessage deserialize(std::span<const std::uint8_t> data);
};

struct PasswordRequiredMessage {
    static constexpr MessageType TYPE = MessageType::PASSWORD_REQUIRED;
    
    std::string challenge;
    bool error = false;            // previous submission was rejected
    
    std::vector<std::uint8_t> serialize() const;
    static PasswordRequiredMessage deserialize(std::span<const std::uint8_t> data);
};

struct UsePasswordMessage {
    static constexpr MessageType TYPE = MessageType::USE_PASSWORD;
    
    std::string response;
    
    std::vector<std::uint8_t> serialize() const;
    static UsePasswordMessage deserialize(std::span<const std::uint8_t> data);
};

struct InfoMessage {
    static constexpr MessageType TYPE = MessageType::INFO;
    
    FileInfo file;
    
    std::vector<std::uint8_t> serialize() const;
    static InfoMessage deserialize(std::span<const std::uint8_t> data);
};

struct StartMessage {
    static constexpr MessageType TYPE = MessageType::START;
    
    std::uint64_t offset = 0;
    
    std::vector<std::uint8_t> serialize() const;
    static StartMessage deserialize(std::span<const std::uint8_t> data);
};

// Companion of a binary frame: `offset` is where that frame's bytes start,
// `final` marks the last frame of the transfer.
struct ChunkMessage {
    static constexpr MessageType TYPE = MessageType::CHUNK;
    
    std::uint64_t offset = 0;
    bool final = false;
    
    std::vector<std::uint8_t> serialize() const;
    static ChunkMessage deserialize(std::span<const std::uint8_t> data);
};

struct ChunkAckMessage {
    static constexpr MessageType TYPE = MessageType::CHUNK_ACK;
    
    std::uint64_t bytes_received = 0;
    
    std::vector<std::uint8_t> serialize() const;
    static ChunkAckMessage deserialize(std::span<const std::uint8_t> data);
};

struct DoneMessage {
    static constexpr MessageType TYPE = MessageType::DONE;
    
    std::vector<std::uint8_t> serialize() const;
    static DoneMessage deserialize(std::span<const std::uint8_t> data);
};

struct ErrorMessage {
    static constexpr MessageType TYPE = MessageType::ERROR;
    
    std::string message;
    
    std::vector<std::uint8_t> serialize() const;
    static ErrorMessage deserialize(std::span<const std::uint8_t> data);
};

using ControlMessage = std::variant<
    RequestInfoMessage,
    PasswordRequiredMessage,
    UsePasswordMessage,
    InfoMessage,
    StartMessage,
    ChunkMessage,
    ChunkAckMessage,
    DoneMessage,
    ErrorMessage>;

struct BinaryChunk {
    std::vector<std::uint8_t> data;
};

// What a Channel delivers: either a structured control message or raw file
// bytes. Session code switches on the alternative, never on the bytes.
using Frame = std::variant<ControlMessage, BinaryChunk>;

MessageType message_type(const ControlMessage& message);

class FrameCodec {
public:
    static std::vector<std::uint8_t> encode(const Frame& frame);
    static std::vector<std::uint8_t> encode_control(const ControlMessage& message);
    static std::vector<std::uint8_t> encode_binary(std::span<const std::uint8_t> data);
    
    // Decodes exactly one frame. Throws std::runtime_error on malformed input.
    static Frame decode(std::span<const std::uint8_t> data);
    
    // Decodes a payload whose header was already read off a stream.
    static Frame decode_payload(const FrameHeader& header, std::vector<std::uint8_t> payload);
};

}

static_assert(peerdrop::network::MessagePayload<peerdrop::network::RequestInfoMessage>);
static_assert(peerdrop::network::MessagePayload<peerdrop::network::PasswordRequiredMessage>);
static_assert(peerdrop::network::MessagePayload<peerdrop::network::UsePasswordMessage>);
static_assert(peerdrop::network::MessagePayload<peerdrop::network::InfoMessage>);
static_assert(peerdrop::network::MessagePayload<peerdrop::network::StartMessage>);
static_assert(peerdrop::network::MessagePayload<peerdrop::network::ChunkMessage>);
static_assert(peerdrop::network::MessagePayload<peerdrop::network::ChunkAckMessage>);
static_assert(peerdrop::network::MessagePayload<peerdrop::network::DoneMessage>);
static_assert(peerdrop::network::MessagePayload<peerdrop::network::ErrorMessage>);
