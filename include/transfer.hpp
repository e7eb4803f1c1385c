#pragma once

#include <string>
#include <functional>
#include <boost/asio.hpp>
#include "protocol/packet.hpp"
#include "protocol/file_meta.hpp"

namespace transfer {

// Progress callback: filename, bytes_transferred, bytes_total, speed_mbps
using TransferProgressCallback = std::function<void(const std::string&, uint64_t, uint64_t, double)>;

enum class TransferState {
    COMPLETED,
    FAILED
};

enum class ErrorKind {
    NONE,
    PROTOCOL,
    CONNECTION_CLOSED,
    INVALID_FILENAME,
    REJECTED,
    ENCODING,
    IO
};

const char* to_string(ErrorKind kind);

// Outcome of one file transfer attempt, on either side of the connection
struct TransferResult {
    TransferState state = TransferState::FAILED;
    ErrorKind error = ErrorKind::NONE;
    std::string filename;          // name as declared in FINFO
    std::string path;              // local source or saved destination
    uint64_t bytes_transferred = 0;
    uint64_t total_bytes = 0;
    std::string detail;

    bool ok() const { return state == TransferState::COMPLETED; }
};

class MessageSender {
public:
    static void send(boost::asio::ip::tcp::socket& socket, protocol::MessageType type,
                     const std::string& payload);
    static void send(boost::asio::ip::tcp::socket& socket, protocol::MessageType type,
                     const uint8_t* data, std::size_t size);
    static void send_file_info(boost::asio::ip::tcp::socket& socket, const protocol::FileInfo& info);
    static void send_ack(boost::asio::ip::tcp::socket& socket, const std::string& text);

    // Best effort: returns false instead of throwing when the socket is unusable
    static bool try_send_error(boost::asio::ip::tcp::socket& socket, const std::string& text);
};

class MessageReceiver {
public:
    static protocol::MessageHeader receive_header(boost::asio::ip::tcp::socket& socket);
    static protocol::Message receive(boost::asio::ip::tcp::socket& socket,
                                     uint32_t max_payload = protocol::kMaxPayloadSize);
};

// Shuts down and closes the socket, ignoring errors from an already dead peer
void close_quietly(boost::asio::ip::tcp::socket& socket);

} // namespace transfer
