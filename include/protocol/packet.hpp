#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <vector>
#include <stdexcept>

namespace protocol {

constexpr std::size_t kHeaderSize = 8;
constexpr std::size_t kTagSize = 4;
constexpr std::size_t kChunkSize = 4096;
constexpr uint32_t kMaxPayloadSize = 0xFFFFFFFFu;
// Upper bound sessions accept for any single frame (FINFO json, FDATA chunk, texts)
constexpr uint32_t kMaxControlPayload = 64 * 1024;

enum class MessageType : uint8_t {
    FINFO,
    FDATA,
    FEND,
    ACK,
    ERR
};

// Fixed 8-byte header
struct MessageHeader {
    MessageType type;      // 4 bytes ASCII tag on the wire
    uint32_t payload_size; // 4 bytes big-endian
};

struct Message {
    MessageType type;
    std::vector<uint8_t> payload;

    std::string text() const { return std::string(payload.begin(), payload.end()); }
};

// ─── Errors ─────────────────────────────────────────────────────────────────

class TransferError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed frame, unexpected message type or unrecognized tag
class ProtocolError : public TransferError {
public:
    using TransferError::TransferError;
};

class EncodingError : public TransferError {
public:
    using TransferError::TransferError;
};

// Stream ended (or failed) before a full message or sequence was exchanged
class ConnectionClosed : public TransferError {
public:
    using TransferError::TransferError;
};

// Peer answered with ERR or refused the declared transfer
class RejectedError : public TransferError {
public:
    using TransferError::TransferError;
};

// ─── Tags ───────────────────────────────────────────────────────────────────

const char* tag_of(MessageType type);
const char* to_string(MessageType type);

// ─── Framing ────────────────────────────────────────────────────────────────

std::array<uint8_t, kHeaderSize> serialize_header(const MessageHeader& header);
MessageHeader deserialize_header(const std::array<uint8_t, kHeaderSize>& buffer);

std::vector<uint8_t> encode(MessageType type, const uint8_t* data, std::size_t size);
std::vector<uint8_t> encode(MessageType type, const std::vector<uint8_t>& payload);
std::vector<uint8_t> encode(MessageType type, const std::string& payload);

} // namespace protocol
