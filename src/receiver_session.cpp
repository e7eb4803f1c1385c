#include "session.hpp"
#include "filename_policy.hpp"
#include <iostream>
#include <cstdio>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

namespace transfer {

namespace {

class LocalFileError : public protocol::TransferError {
public:
    using protocol::TransferError::TransferError;
};

// Destination file that deletes itself unless committed
class PartialFile {
public:
    explicit PartialFile(fs::path path) : path_(std::move(path)) {
        out_.open(path_, std::ios::binary | std::ios::trunc);
        if (!out_.is_open()) {
            discard();
            throw LocalFileError("Could not open file for writing: " + path_.string());
        }
    }

    ~PartialFile() {
        if (!committed_) discard();
    }

    PartialFile(const PartialFile&) = delete;
    PartialFile& operator=(const PartialFile&) = delete;

    void write(const std::vector<uint8_t>& data) {
        out_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!out_) {
            throw LocalFileError("Failed writing to " + path_.string());
        }
    }

    void finish() {
        out_.flush();
        out_.close();
        if (out_.fail()) {
            throw LocalFileError("Failed to flush " + path_.string());
        }
    }

    void commit() { committed_ = true; }

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    std::ofstream out_;
    bool committed_ = false;

    void discard() {
        if (out_.is_open()) out_.close();
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            std::cerr << "ReceiverSession: could not remove partial file " << path_ << ": " << ec.message() << "\n";
        }
    }
};

std::string percent_text(uint64_t done, uint64_t total) {
    double progress = (total > 0) ? (static_cast<double>(done) / total) * 100.0 : 100.0;
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f%%", progress);
    return buf;
}

} // namespace

const char* to_string(ReceiverSession::State state) {
    switch (state) {
    case ReceiverSession::State::ACCEPTED:
        return "ACCEPTED";
    case ReceiverSession::State::AWAIT_INFO:
        return "AWAIT_INFO";
    case ReceiverSession::State::RECEIVING:
        return "RECEIVING";
    case ReceiverSession::State::AWAIT_END:
        return "AWAIT_END";
    case ReceiverSession::State::DONE:
        return "DONE";
    default:
        return "ERROR";
    }
}

ReceiverSession::ReceiverSession(boost::asio::ip::tcp::socket& socket, fs::path receive_dir,
                                 SessionCallbacks callbacks)
    : socket_(socket), receive_dir_(std::move(receive_dir)), callbacks_(std::move(callbacks)) {}

void ReceiverSession::status(const std::string& text) const {
    if (callbacks_.on_status) callbacks_.on_status(text);
}

TransferResult ReceiverSession::run() {
    TransferResult result;
    std::unique_ptr<PartialFile> file;

    auto fail = [&](ErrorKind kind, const std::string& detail, bool notify_peer) {
        state_ = State::ERROR;
        // Close and delete before telling anyone
        file.reset();
        if (notify_peer) {
            MessageSender::try_send_error(socket_, detail);
        }
        result.state = TransferState::FAILED;
        result.error = kind;
        result.detail = detail;
        status("Transfer failed: " + detail);
        return result;
    };

    try {
        state_ = State::AWAIT_INFO;
        protocol::Message first = MessageReceiver::receive(socket_, protocol::kMaxControlPayload);
        if (first.type != protocol::MessageType::FINFO) {
            throw protocol::ProtocolError("Expected file info message");
        }

        protocol::FileInfo info = protocol::parse_file_info(first.text());
        result.total_bytes = info.filesize;
        std::string safe_name = naming::sanitize(info.filename);
        result.filename = safe_name;

        file = std::make_unique<PartialFile>(naming::reserve_path(receive_dir_, safe_name));
        result.path = file->path().string();
        status("Receiving file: " + safe_name + " (" + std::to_string(info.filesize) + " bytes)");

        MessageSender::send_ack(socket_, "Ready to receive file");
        state_ = (info.filesize == 0) ? State::AWAIT_END : State::RECEIVING;

        SpeedMeter meter;
        while (true) {
            protocol::Message msg = MessageReceiver::receive(socket_, protocol::kMaxControlPayload);

            if (msg.type == protocol::MessageType::FDATA) {
                if (msg.payload.size() > protocol::kChunkSize) {
                    throw protocol::ProtocolError("FDATA chunk of " + std::to_string(msg.payload.size()) +
                                                  " bytes exceeds chunk size");
                }
                if (msg.payload.size() > info.filesize - result.bytes_transferred) {
                    throw protocol::ProtocolError("Received more data than the declared " +
                                                  std::to_string(info.filesize) + " bytes");
                }
                file->write(msg.payload);
                result.bytes_transferred += msg.payload.size();

                MessageSender::send_ack(socket_, "Received " + std::to_string(result.bytes_transferred) + "/" +
                                                     std::to_string(info.filesize) + " bytes (" +
                                                     percent_text(result.bytes_transferred, info.filesize) + ")");
                if (result.bytes_transferred == info.filesize) {
                    state_ = State::AWAIT_END;
                }
                if (callbacks_.on_progress) {
                    callbacks_.on_progress(safe_name, result.bytes_transferred, info.filesize,
                                           meter.mbps(result.bytes_transferred));
                }
            } else if (msg.type == protocol::MessageType::FEND) {
                if (result.bytes_transferred != info.filesize) {
                    throw protocol::ProtocolError("File transfer incomplete: " +
                                                  std::to_string(result.bytes_transferred) + "/" +
                                                  std::to_string(info.filesize) + " bytes");
                }
                break;
            } else {
                throw protocol::ProtocolError(std::string("Unexpected message type: ") +
                                              protocol::to_string(msg.type));
            }
        }

        file->finish();
        MessageSender::send_ack(socket_, "File '" + safe_name + "' received successfully");
        file->commit();
        state_ = State::DONE;
    } catch (const protocol::ConnectionClosed& e) {
        return fail(ErrorKind::CONNECTION_CLOSED, e.what(), false);
    } catch (const naming::InvalidFilenameError& e) {
        return fail(ErrorKind::INVALID_FILENAME, e.what(), true);
    } catch (const protocol::ProtocolError& e) {
        return fail(ErrorKind::PROTOCOL, e.what(), true);
    } catch (const protocol::EncodingError& e) {
        return fail(ErrorKind::ENCODING, e.what(), true);
    } catch (const LocalFileError& e) {
        return fail(ErrorKind::IO, std::string("Server error: ") + e.what(), true);
    } catch (const fs::filesystem_error& e) {
        return fail(ErrorKind::IO, std::string("Server error: ") + e.what(), true);
    }

    result.state = TransferState::COMPLETED;
    status("File received successfully: " + result.path);
    return result;
}

} // namespace transfer
