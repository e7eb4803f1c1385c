#pragma once

#include <string>
#include <chrono>
#include <fstream>
#include <atomic>
#include <functional>
#include <filesystem>
#include <boost/asio.hpp>
#include "transfer.hpp"

namespace transfer {

using StatusCallback = std::function<void(const std::string&)>;

// Invoked from the session's thread; implementations must not block
struct SessionCallbacks {
    StatusCallback on_status;
    TransferProgressCallback on_progress;
};

// Throughput since construction, in MB/s
class SpeedMeter {
public:
    SpeedMeter() : start_(std::chrono::steady_clock::now()) {}

    double mbps(uint64_t bytes) const {
        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
        return (elapsed > 0) ? (bytes / elapsed / (1024.0 * 1024.0)) : 0;
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// Client side of one file transfer:
//   CONNECTED -> SENT_INFO -> READY -> (SENDING_CHUNKS -> READY)* -> SENT_END -> DONE
// Any failure lands in ERROR with the connection closed.
class SenderSession {
public:
    enum class State {
        INIT,
        CONNECTED,
        SENT_INFO,
        READY,
        SENDING_CHUNKS,
        SENT_END,
        DONE,
        ERROR
    };

    SenderSession(boost::asio::io_context& io_context, std::string host, unsigned short port,
                  std::string filepath, SessionCallbacks callbacks = {});

    // Runs the whole exchange; never throws
    TransferResult run();

    State state() const { return state_; }

private:
    boost::asio::io_context& io_context_;
    std::string host_;
    unsigned short port_;
    std::string filepath_;
    SessionCallbacks callbacks_;
    std::atomic<State> state_{State::INIT};

    std::string await_ack(boost::asio::ip::tcp::socket& socket);
    void send_chunks(boost::asio::ip::tcp::socket& socket, std::ifstream& file, TransferResult& result);
};

// Server side of one accepted connection:
//   ACCEPTED -> AWAIT_INFO -> RECEIVING -> AWAIT_END -> DONE
// On failure the partially written file is removed and ERR is sent when possible.
class ReceiverSession {
public:
    enum class State {
        ACCEPTED,
        AWAIT_INFO,
        RECEIVING,
        AWAIT_END,
        DONE,
        ERROR
    };

    ReceiverSession(boost::asio::ip::tcp::socket& socket, std::filesystem::path receive_dir,
                    SessionCallbacks callbacks = {});

    // Runs the whole exchange; never throws
    TransferResult run();

    State state() const { return state_; }

private:
    boost::asio::ip::tcp::socket& socket_;
    std::filesystem::path receive_dir_;
    SessionCallbacks callbacks_;
    std::atomic<State> state_{State::ACCEPTED};

    void status(const std::string& text) const;
};

const char* to_string(SenderSession::State state);
const char* to_string(ReceiverSession::State state);

} // namespace transfer
