#include "peerdrop/network/protocol.hpp"
#include <algorithm>
#include <stdexcept>

namespace peerdrop::network {

namespace {
    constexpr std::array<std::uint32_t, 256> make_crc_table() {
        std::array<std::uint32_t, 256> table{};
        for (std::uint32_t i = 0; i < 256; ++i) {
            std::uint32_t c = i;
            for (int k = 0; k < 8; ++k) {
                c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
            }
            table[i] = c;
        }
        return table;
    }
    
    constexpr auto crc_table = make_crc_table();
    
    std::uint32_t calculate_crc32(std::span<const std::uint8_t> data) {
        std::uint32_t crc = 0xFFFFFFFF;
        for (auto byte : data) {
            crc = crc_table[(crc ^ byte) & 0xFF] ^ (crc >> 8);
        }
        return crc ^ 0xFFFFFFFF;
    }
    
    void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value) {
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }
    
    void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            buffer.push_back((value >> shift) & 0xFF);
        }
    }
    
    void write_uint64(std::vector<std::uint8_t>& buffer, std::uint64_t value) {
        for (int shift = 56; shift >= 0; shift -= 8) {
            buffer.push_back((value >> shift) & 0xFF);
        }
    }
    
    void write_bool(std::vector<std::uint8_t>& buffer, bool value) {
        buffer.push_back(value ? 1 : 0);
    }
    
    void write_string(std::vector<std::uint8_t>& buffer, const std::string& str) {
        write_uint32(buffer, static_cast<std::uint32_t>(str.size()));
        buffer.insert(buffer.end(), str.begin(), str.end());
    }
    
    std::uint8_t read_uint8(std::span<const std::uint8_t>& data) {
        if (data.empty()) throw std::runtime_error("Insufficient data for uint8");
        auto value = data[0];
        data = data.subspan(1);
        return value;
    }
    
    std::uint16_t read_uint16(std::span<const std::uint8_t>& data) {
        if (data.size() < 2) throw std::runtime_error("Insufficient data for uint16");
        std::uint16_t value = (static_cast<std::uint16_t>(data[0]) << 8) |
                             static_cast<std::uint16_t>(data[1]);
        data = data.subspan(2);
        return value;
    }
    
    std::uint32_t read_uint32(std::span<const std::uint8_t>& data) {
        if (data.size() < 4) throw std::runtime_error("Insufficient data for uint32");
        std::uint32_t value = 0;
        for (std::size_t i = 0; i < 4; ++i) {
            value = (value << 8) | data[i];
        }
        data = data.subspan(4);
        return value;
    }
    
    std::uint64_t read_uint64(std::span<const std::uint8_t>& data) {
        if (data.size() < 8) throw std::runtime_error("Insufficient data for uint64");
        std::uint64_t value = 0;
        for (std::size_t i = 0; i < 8; ++i) {
            value = (value << 8) | data[i];
        }
        data = data.subspan(8);
        return value;
    }
    
    bool read_bool(std::span<const std::uint8_t>& data) {
        auto value = read_uint8(data);
        if (value > 1) throw std::runtime_error("Invalid boolean value");
        return value == 1;
    }
    
    std::string read_string(std::span<const std::uint8_t>& data) {
        auto length = read_uint32(data);
        if (data.size() < length) throw std::runtime_error("Insufficient data for string");
        std::string str(reinterpret_cast<const char*>(data.data()), length);
        data = data.subspan(length);
        return str;
    }
    
    void expect_consumed(std::span<const std::uint8_t> rest, const char* what) {
        if (!rest.empty()) {
            throw std::runtime_error(std::string("Trailing bytes after ") + what);
        }
    }
    
    template<MessagePayload T>
    ControlMessage decode_as(std::span<const std::uint8_t> payload) {
        return T::deserialize(payload);
    }
}

const char* to_string(MessageType type) {
    switch (type) {
        case MessageType::NONE: return "None";
        case MessageType::REQUEST_INFO: return "RequestInfo";
        case MessageType::PASSWORD_REQUIRED: return "PasswordRequired";
        case MessageType::USE_PASSWORD: return "UsePassword";
        case MessageType::INFO: return "Info";
        case MessageType::START: return "Start";
        case MessageType::CHUNK: return "Chunk";
        case MessageType::CHUNK_ACK: return "ChunkAck";
        case MessageType::DONE: return "Done";
        case MessageType::ERROR: return "Error";
    }
    return "Unknown";
}

FrameHeader::FrameHeader()
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , kind(FrameKind::CONTROL)
    , type(MessageType::NONE)
    , payload_size(0)
    , checksum{0, 0, 0, 0} {
}

FrameHeader::FrameHeader(FrameKind frame_kind, MessageType msg_type, std::uint32_t payload_len)
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , kind(frame_kind)
    , type(msg_type)
    , payload_size(payload_len)
    , checksum{0, 0, 0, 0} {
}

bool FrameHeader::is_valid() const {
    if (magic != PROTOCOL_MAGIC || version != PROTOCOL_VERSION) {
        return false;
    }
    if (payload_size > MAX_FRAME_PAYLOAD) {
        return false;
    }
    switch (kind) {
        case FrameKind::CONTROL:
            return type != MessageType::NONE;
        case FrameKind::BINARY:
            return type == MessageType::NONE;
    }
    return false;
}

void FrameHeader::calculate_checksum(std::span<const std::uint8_t> payload) {
    auto crc = calculate_crc32(payload);
    checksum[0] = (crc >> 24) & 0xFF;
    checksum[1] = (crc >> 16) & 0xFF;
    checksum[2] = (crc >> 8) & 0xFF;
    checksum[3] = crc & 0xFF;
}

bool FrameHeader::verify_checksum(std::span<const std::uint8_t> payload) const {
    auto expected_crc = calculate_crc32(payload);
    auto actual_crc = (static_cast<std::uint32_t>(checksum[0]) << 24) |
                     (static_cast<std::uint32_t>(checksum[1]) << 16) |
                     (static_cast<std::uint32_t>(checksum[2]) << 8) |
                     static_cast<std::uint32_t>(checksum[3]);
    return expected_crc == actual_crc;
}

std::vector<std::uint8_t> FrameHeader::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(FRAME_HEADER_SIZE);
    
    write_uint32(buffer, magic);
    write_uint16(buffer, version);
    buffer.push_back(static_cast<std::uint8_t>(kind));
    buffer.push_back(static_cast<std::uint8_t>(type));
    write_uint32(buffer, payload_size);
    buffer.insert(buffer.end(), checksum.begin(), checksum.end());
    
    return buffer;
}

FrameHeader FrameHeader::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() < FRAME_HEADER_SIZE) {
        throw std::runtime_error("Insufficient data for frame header");
    }
    
    FrameHeader header;
    auto span = data;
    
    header.magic = read_uint32(span);
    header.version = read_uint16(span);
    header.kind = static_cast<FrameKind>(read_uint8(span));
    header.type = static_cast<MessageType>(read_uint8(span));
    header.payload_size = read_uint32(span);
    std::copy(span.begin(), span.begin() + 4, header.checksum.begin());
    
    return header;
}

std::vector<std::uint8_t> RequestInfoMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, browser_name);
    write_string(buffer, os_name);
    return buffer;
}

RequestInfoMessage RequestInfoMessage::deserialize(std::span<const std::uint8_t> data) {
    RequestInfoMessage msg;
    auto span = data;
    msg.browser_name = read_string(span);
    msg.os_name = read_string(span);
    expect_consumed(span, "RequestInfo");
    return msg;
}

std::vector<std::uint8_t> PasswordRequiredMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, challenge);
    write_bool(buffer, error);
    return buffer;
}

PasswordRequiredMessage PasswordRequiredMessage::deserialize(std::span<const std::uint8_t> data) {
    PasswordRequiredMessage msg;
    auto span = data;
    msg.challenge = read_string(span);
    msg.error = read_bool(span);
    expect_consumed(span, "PasswordRequired");
    return msg;
}

std::vector<std::uint8_t> UsePasswordMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, response);
    return buffer;
}

UsePasswordMessage UsePasswordMessage::deserialize(std::span<const std::uint8_t> data) {
    UsePasswordMessage msg;
    auto span = data;
    msg.response = read_string(span);
    expect_consumed(span, "UsePassword");
    return msg;
}

std::vector<std::uint8_t> InfoMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file.name);
    write_uint64(buffer, file.size);
    write_string(buffer, file.mime_type);
    return buffer;
}

InfoMessage InfoMessage::deserialize(std::span<const std::uint8_t> data) {
    InfoMessage msg;
    auto span = data;
    msg.file.name = read_string(span);
    msg.file.size = read_uint64(span);
    msg.file.mime_type = read_string(span);
    expect_consumed(span, "Info");
    return msg;
}

std::vector<std::uint8_t> StartMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint64(buffer, offset);
    return buffer;
}

StartMessage StartMessage::deserialize(std::span<const std::uint8_t> data) {
    StartMessage msg;
    auto span = data;
    msg.offset = read_uint64(span);
    expect_consumed(span, "Start");
    return msg;
}

std::vector<std::uint8_t> ChunkMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint64(buffer, offset);
    write_bool(buffer, final);
    return buffer;
}

ChunkMessage ChunkMessage::deserialize(std::span<const std::uint8_t> data) {
    ChunkMessage msg;
    auto span = data;
    msg.offset = read_uint64(span);
    msg.final = read_bool(span);
    expect_consumed(span, "Chunk");
    return msg;
}

std::vector<std::uint8_t> ChunkAckMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint64(buffer, bytes_received);
    return buffer;
}

ChunkAckMessage ChunkAckMessage::deserialize(std::span<const std::uint8_t> data) {
    ChunkAckMessage msg;
    auto span = data;
    msg.bytes_received = read_uint64(span);
    expect_consumed(span, "ChunkAck");
    return msg;
}

std::vector<std::uint8_t> DoneMessage::serialize() const {
    return {};
}

DoneMessage DoneMessage::deserialize(std::span<const std::uint8_t> data) {
    expect_consumed(data, "Done");
    return DoneMessage{};
}

std::vector<std::uint8_t> ErrorMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, message);
    return buffer;
}

ErrorMessage ErrorMessage::deserialize(std::span<const std::uint8_t> data) {
    ErrorMessage msg;
    auto span = data;
    msg.message = read_string(span);
    expect_consumed(span, "Error");
    return msg;
}

MessageType message_type(const ControlMessage& message) {
    return std::visit([](const auto& msg) { return std::decay_t<decltype(msg)>::TYPE; }, message);
}

std::vector<std::uint8_t> FrameCodec::encode(const Frame& frame) {
    if (const auto* control = std::get_if<ControlMessage>(&frame)) {
        return encode_control(*control);
    }
    return encode_binary(std::get<BinaryChunk>(frame).data);
}

std::vector<std::uint8_t> FrameCodec::encode_control(const ControlMessage& message) {
    auto payload = std::visit([](const auto& msg) { return msg.serialize(); }, message);
    if (payload.size() > MAX_FRAME_PAYLOAD) {
        throw std::runtime_error("Control payload exceeds maximum frame size");
    }
    
    FrameHeader header(FrameKind::CONTROL, message_type(message),
                       static_cast<std::uint32_t>(payload.size()));
    header.calculate_checksum(payload);
    
    auto buffer = header.serialize();
    buffer.insert(buffer.end(), payload.begin(), payload.end());
    return buffer;
}

std::vector<std::uint8_t> FrameCodec::encode_binary(std::span<const std::uint8_t> data) {
    if (data.size() > MAX_FRAME_PAYLOAD) {
        throw std::runtime_error("Binary payload exceeds maximum frame size");
    }
    
    FrameHeader header(FrameKind::BINARY, MessageType::NONE,
                       static_cast<std::uint32_t>(data.size()));
    header.calculate_checksum(data);
    
    auto buffer = header.serialize();
    buffer.insert(buffer.end(), data.begin(), data.end());
    return buffer;
}

Frame FrameCodec::decode(std::span<const std::uint8_t> data) {
    auto header = FrameHeader::deserialize(data);
    auto payload = data.subspan(FRAME_HEADER_SIZE);
    if (payload.size() != header.payload_size) {
        throw std::runtime_error("Frame length does not match header payload size");
    }
    return decode_payload(header, std::vector<std::uint8_t>(payload.begin(), payload.end()));
}

Frame FrameCodec::decode_payload(const FrameHeader& header, std::vector<std::uint8_t> payload) {
    if (!header.is_valid()) {
        throw std::runtime_error("Invalid frame header");
    }
    if (payload.size() != header.payload_size) {
        throw std::runtime_error("Payload size mismatch");
    }
    if (!header.verify_checksum(payload)) {
        throw std::runtime_error("Frame checksum mismatch");
    }
    
    if (header.kind == FrameKind::BINARY) {
        return BinaryChunk{std::move(payload)};
    }
    
    std::span<const std::uint8_t> span(payload);
    switch (header.type) {
        case MessageType::REQUEST_INFO: return decode_as<RequestInfoMessage>(span);
        case MessageType::PASSWORD_REQUIRED: return decode_as<PasswordRequiredMessage>(span);
        case MessageType::USE_PASSWORD: return decode_as<UsePasswordMessage>(span);
        case MessageType::INFO: return decode_as<InfoMessage>(span);
        case MessageType::START: return decode_as<StartMessage>(span);
        case MessageType::CHUNK: return decode_as<ChunkMessage>(span);
        case MessageType::CHUNK_ACK: return decode_as<ChunkAckMessage>(span);
        case MessageType::DONE: return decode_as<DoneMessage>(span);
        case MessageType::ERROR: return decode_as<ErrorMessage>(span);
        case MessageType::NONE: break;
    }
    throw std::runtime_error("Unknown control message type");
}

}
