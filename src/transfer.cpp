#include "transfer.hpp"
#include <iostream>
#include <vector>

namespace transfer {

const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NONE:
        return "none";
    case ErrorKind::PROTOCOL:
        return "protocol error";
    case ErrorKind::CONNECTION_CLOSED:
        return "connection closed";
    case ErrorKind::INVALID_FILENAME:
        return "invalid filename";
    case ErrorKind::REJECTED:
        return "rejected by peer";
    case ErrorKind::ENCODING:
        return "encoding error";
    default:
        return "i/o error";
    }
}

void MessageSender::send(boost::asio::ip::tcp::socket& socket, protocol::MessageType type,
                         const uint8_t* data, std::size_t size) {
    std::vector<uint8_t> frame = protocol::encode(type, data, size);

    boost::system::error_code ec;
    boost::asio::write(socket, boost::asio::buffer(frame), ec);
    if (ec) {
        throw protocol::ConnectionClosed(std::string("Failed to send ") +
                                         protocol::to_string(type) + ": " + ec.message());
    }
}

void MessageSender::send(boost::asio::ip::tcp::socket& socket, protocol::MessageType type,
                         const std::string& payload) {
    send(socket, type, reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
}

void MessageSender::send_file_info(boost::asio::ip::tcp::socket& socket, const protocol::FileInfo& info) {
    send(socket, protocol::MessageType::FINFO, protocol::serialize_file_info(info));
}

void MessageSender::send_ack(boost::asio::ip::tcp::socket& socket, const std::string& text) {
    send(socket, protocol::MessageType::ACK, text);
}

bool MessageSender::try_send_error(boost::asio::ip::tcp::socket& socket, const std::string& text) {
    if (!socket.is_open()) return false;
    try {
        send(socket, protocol::MessageType::ERR, text);
        return true;
    } catch (const protocol::TransferError& e) {
        std::cerr << "MessageSender: could not deliver ERR: " << e.what() << "\n";
        return false;
    }
}

protocol::MessageHeader MessageReceiver::receive_header(boost::asio::ip::tcp::socket& socket) {
    std::array<uint8_t, protocol::kHeaderSize> buf;
    boost::system::error_code ec;
    boost::asio::read(socket, boost::asio::buffer(buf), ec);
    if (ec) {
        if (ec == boost::asio::error::eof) {
            throw protocol::ConnectionClosed("Connection closed while reading message header");
        }
        throw protocol::ConnectionClosed("Failed to read message header: " + ec.message());
    }
    return protocol::deserialize_header(buf);
}

protocol::Message MessageReceiver::receive(boost::asio::ip::tcp::socket& socket, uint32_t max_payload) {
    protocol::MessageHeader header = receive_header(socket);
    if (header.payload_size > max_payload) {
        throw protocol::ProtocolError(std::string(protocol::to_string(header.type)) + " payload of " +
                                      std::to_string(header.payload_size) + " bytes exceeds limit of " +
                                      std::to_string(max_payload));
    }

    protocol::Message message{header.type, std::vector<uint8_t>(header.payload_size)};
    if (header.payload_size == 0) {
        return message;
    }

    boost::system::error_code ec;
    boost::asio::read(socket, boost::asio::buffer(message.payload), ec);
    if (ec) {
        if (ec == boost::asio::error::eof) {
            throw protocol::ConnectionClosed("Connection closed while reading " +
                                             std::string(protocol::to_string(header.type)) + " payload");
        }
        throw protocol::ConnectionClosed("Failed to read message payload: " + ec.message());
    }
    return message;
}

void close_quietly(boost::asio::ip::tcp::socket& socket) {
    boost::system::error_code ec;
    if (!socket.is_open()) return;
    socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket.close(ec);
}

} // namespace transfer
