#include "session.hpp"
#include "filename_policy.hpp"
#include <vector>
#include <algorithm>

namespace fs = std::filesystem;
using boost::asio::ip::tcp;

namespace transfer {

namespace {

// Local file could not be read as declared
class LocalFileError : public protocol::TransferError {
public:
    using protocol::TransferError::TransferError;
};

} // namespace

const char* to_string(SenderSession::State state) {
    switch (state) {
    case SenderSession::State::INIT:
        return "INIT";
    case SenderSession::State::CONNECTED:
        return "CONNECTED";
    case SenderSession::State::SENT_INFO:
        return "SENT_INFO";
    case SenderSession::State::READY:
        return "READY";
    case SenderSession::State::SENDING_CHUNKS:
        return "SENDING_CHUNKS";
    case SenderSession::State::SENT_END:
        return "SENT_END";
    case SenderSession::State::DONE:
        return "DONE";
    default:
        return "ERROR";
    }
}

SenderSession::SenderSession(boost::asio::io_context& io_context, std::string host, unsigned short port,
                             std::string filepath, SessionCallbacks callbacks)
    : io_context_(io_context),
      host_(std::move(host)),
      port_(port),
      filepath_(std::move(filepath)),
      callbacks_(std::move(callbacks)) {}

std::string SenderSession::await_ack(tcp::socket& socket) {
    protocol::Message reply = MessageReceiver::receive(socket, protocol::kMaxControlPayload);
    if (reply.type == protocol::MessageType::ERR) {
        throw protocol::RejectedError("Server error: " + reply.text());
    }
    if (reply.type != protocol::MessageType::ACK) {
        throw protocol::RejectedError(std::string("Server replied ") + protocol::to_string(reply.type) +
                                      " instead of ACK: " + reply.text());
    }
    return reply.text();
}

void SenderSession::send_chunks(tcp::socket& socket, std::ifstream& file, TransferResult& result) {
    SpeedMeter meter;
    std::vector<char> buffer(protocol::kChunkSize);

    while (result.bytes_transferred < result.total_bytes) {
        uint64_t remaining = result.total_bytes - result.bytes_transferred;
        auto want = static_cast<std::streamsize>(std::min<uint64_t>(buffer.size(), remaining));
        file.read(buffer.data(), want);
        std::streamsize bytes_read = file.gcount();
        if (bytes_read <= 0) {
            break;
        }

        state_ = State::SENDING_CHUNKS;
        MessageSender::send(socket, protocol::MessageType::FDATA,
                            reinterpret_cast<const uint8_t*>(buffer.data()),
                            static_cast<std::size_t>(bytes_read));
        await_ack(socket);
        result.bytes_transferred += static_cast<uint64_t>(bytes_read);
        state_ = State::READY;

        if (callbacks_.on_progress) {
            callbacks_.on_progress(result.filename, result.bytes_transferred, result.total_bytes,
                                   meter.mbps(result.bytes_transferred));
        }
    }

    if (result.bytes_transferred < result.total_bytes) {
        throw LocalFileError("File ended after " + std::to_string(result.bytes_transferred) + " of " +
                             std::to_string(result.total_bytes) + " bytes");
    }
}

TransferResult SenderSession::run() {
    TransferResult result;
    result.path = filepath_;

    auto fail = [&](ErrorKind kind, const std::string& detail) {
        state_ = State::ERROR;
        result.state = TransferState::FAILED;
        result.error = kind;
        result.detail = detail;
        return result;
    };

    std::error_code ec;
    if (!fs::is_regular_file(filepath_, ec)) {
        return fail(ErrorKind::IO, "Not a regular file: " + filepath_);
    }
    result.total_bytes = fs::file_size(filepath_, ec);
    if (ec) {
        return fail(ErrorKind::IO, "Could not stat " + filepath_ + ": " + ec.message());
    }

    try {
        result.filename = naming::sanitize(fs::path(filepath_).filename().string());
    } catch (const naming::InvalidFilenameError& e) {
        return fail(ErrorKind::INVALID_FILENAME, e.what());
    }

    std::ifstream file(filepath_, std::ios::binary);
    if (!file.is_open()) {
        return fail(ErrorKind::IO, "Could not open file for reading: " + filepath_);
    }

    tcp::socket socket(io_context_);
    try {
        tcp::resolver resolver(io_context_);
        boost::asio::connect(socket, resolver.resolve(host_, std::to_string(port_)));
    } catch (const boost::system::system_error& e) {
        return fail(ErrorKind::IO, "Could not connect to " + host_ + ":" + std::to_string(port_) + ": " + e.what());
    }
    state_ = State::CONNECTED;

    try {
        MessageSender::send_file_info(socket, protocol::FileInfo{result.filename, result.total_bytes});
        state_ = State::SENT_INFO;

        std::string ready = await_ack(socket);
        state_ = State::READY;
        if (callbacks_.on_status) callbacks_.on_status("Server ready: " + ready);

        send_chunks(socket, file, result);

        MessageSender::send(socket, protocol::MessageType::FEND, std::string());
        state_ = State::SENT_END;

        std::string final_ack = await_ack(socket);
        state_ = State::DONE;
        if (callbacks_.on_status) callbacks_.on_status(final_ack);
    } catch (const protocol::RejectedError& e) {
        close_quietly(socket);
        return fail(ErrorKind::REJECTED, e.what());
    } catch (const protocol::ConnectionClosed& e) {
        close_quietly(socket);
        return fail(ErrorKind::CONNECTION_CLOSED, e.what());
    } catch (const protocol::ProtocolError& e) {
        close_quietly(socket);
        return fail(ErrorKind::PROTOCOL, e.what());
    } catch (const protocol::EncodingError& e) {
        close_quietly(socket);
        return fail(ErrorKind::ENCODING, e.what());
    } catch (const LocalFileError& e) {
        close_quietly(socket);
        return fail(ErrorKind::IO, e.what());
    }

    close_quietly(socket);
    result.state = TransferState::COMPLETED;
    return result;
}

} // namespace transfer
