#include "protocol/packet.hpp"
#include <arpa/inet.h>
#include <cstdio>
#include <cstring>

namespace protocol {

namespace {

struct TagEntry {
    MessageType type;
    const char* tag;
    const char* name;
};

// Tags must match the peers byte for byte
const TagEntry kTags[] = {
    {MessageType::FINFO, "INFO", "FINFO"},
    {MessageType::FDATA, "DATA", "FDATA"},
    {MessageType::FEND,  "FEND", "FEND"},
    {MessageType::ACK,   "ACK_", "ACK"},
    {MessageType::ERR,   "ERR_", "ERR"},
};

const TagEntry* find_tag(const uint8_t* tag) {
    for (const auto& entry : kTags) {
        if (std::memcmp(entry.tag, tag, kTagSize) == 0) {
            return &entry;
        }
    }
    return nullptr;
}

std::string printable_tag(const uint8_t* tag) {
    std::string out;
    char buf[8];
    for (std::size_t i = 0; i < kTagSize; ++i) {
        if (tag[i] >= 0x20 && tag[i] < 0x7f) {
            out += static_cast<char>(tag[i]);
        } else {
            snprintf(buf, sizeof(buf), "\\x%02x", tag[i]);
            out += buf;
        }
    }
    return out;
}

} // namespace

const char* tag_of(MessageType type) {
    for (const auto& entry : kTags) {
        if (entry.type == type) return entry.tag;
    }
    throw EncodingError("unknown message type");
}

const char* to_string(MessageType type) {
    for (const auto& entry : kTags) {
        if (entry.type == type) return entry.name;
    }
    return "UNKNOWN";
}

std::array<uint8_t, kHeaderSize> serialize_header(const MessageHeader& header) {
    std::array<uint8_t, kHeaderSize> buffer;
    uint32_t payload = htonl(header.payload_size);

    std::memcpy(buffer.data(), tag_of(header.type), kTagSize);
    std::memcpy(buffer.data() + kTagSize, &payload, 4);

    return buffer;
}

MessageHeader deserialize_header(const std::array<uint8_t, kHeaderSize>& buffer) {
    const TagEntry* entry = find_tag(buffer.data());
    if (!entry) {
        throw ProtocolError("Unrecognized message type: '" + printable_tag(buffer.data()) + "'");
    }

    uint32_t payload;
    std::memcpy(&payload, buffer.data() + kTagSize, 4);

    MessageHeader header;
    header.type = entry->type;
    header.payload_size = ntohl(payload);
    return header;
}

std::vector<uint8_t> encode(MessageType type, const uint8_t* data, std::size_t size) {
    if (size > kMaxPayloadSize) {
        throw EncodingError("Payload of " + std::to_string(size) +
                            " bytes exceeds the maximum frame length");
    }

    auto header = serialize_header(MessageHeader{type, static_cast<uint32_t>(size)});
    std::vector<uint8_t> frame;
    frame.reserve(kHeaderSize + size);
    frame.insert(frame.end(), header.begin(), header.end());
    if (size > 0) {
        frame.insert(frame.end(), data, data + size);
    }
    return frame;
}

std::vector<uint8_t> encode(MessageType type, const std::vector<uint8_t>& payload) {
    return encode(type, payload.data(), payload.size());
}

std::vector<uint8_t> encode(MessageType type, const std::string& payload) {
    return encode(type, reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
}

} // namespace protocol
