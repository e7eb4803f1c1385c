#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <set>
#include <memory>
#include <mutex>
#include <functional>
#include <atomic>
#include <condition_variable>
#include <boost/asio.hpp>
#include "transfer.hpp"

namespace networking {

constexpr const char* kDefaultHost = "localhost";
constexpr unsigned short kDefaultPort = 8888;
constexpr const char* kDefaultReceiveDir = "received_files";

// Progress callback: filename, bytes_transferred, bytes_total, speed_mbps
using ProgressCallback = std::function<void(const std::string&, uint64_t, uint64_t, double)>;
using StatusCallback = std::function<void(const std::string&)>;
using ResultCallback = std::function<void(const transfer::TransferResult&)>;

// What a batch does after one file fails
enum class BatchPolicy {
    CONTINUE_ON_ERROR,
    STOP_ON_ERROR
};

struct ServerConfig {
    std::string host = kDefaultHost;
    unsigned short port = kDefaultPort;
    std::string receive_dir = kDefaultReceiveDir;
};

struct ClientConfig {
    std::string host = kDefaultHost;
    unsigned short port = kDefaultPort;
    BatchPolicy policy = BatchPolicy::CONTINUE_ON_ERROR;
};

// All callbacks fire on worker threads and must return quickly
struct ServerCallbacks {
    std::function<void(const std::string& host, unsigned short port)> on_ready;
    StatusCallback on_status;
    ProgressCallback on_progress;
    ResultCallback on_complete;   // once per accepted connection
    std::function<void(const std::string&)> on_error;
};

struct ClientCallbacks {
    StatusCallback on_status;
    ProgressCallback on_progress;
    ResultCallback on_complete;   // once per file attempt
};

// Blocking accept loop; one ReceiverSession thread per connection.
class Server {
public:
    explicit Server(ServerConfig config, ServerCallbacks callbacks = {});
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Returns false if the listener could not be set up, true after stop()
    bool run();

    // Safe from any thread; unblocks run() and aborts live sessions
    void stop();

    bool is_running() const { return running_; }
    unsigned short port() const;
    std::size_t active_sessions() const;

private:
    ServerConfig config_;
    ServerCallbacks callbacks_;
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};

    mutable std::mutex sessions_mutex_;
    std::condition_variable sessions_cv_;
    std::set<std::shared_ptr<boost::asio::ip::tcp::socket>> sessions_;
    std::size_t session_threads_ = 0;
    boost::asio::ip::tcp::endpoint local_endpoint_;

    void status(const std::string& text) const;
    void spawn_session(std::shared_ptr<boost::asio::ip::tcp::socket> socket);
    void wake_acceptor();
};

class Client {
public:
    Client(std::string host, unsigned short port);

    transfer::TransferResult send_file(const std::string& filepath, const ClientCallbacks& callbacks = {});

    // Sequential, one connection per file
    std::vector<transfer::TransferResult> send_files(const std::vector<std::string>& filepaths,
                                                     const ClientCallbacks& callbacks = {},
                                                     BatchPolicy policy = BatchPolicy::CONTINUE_ON_ERROR);

private:
    std::string host_;
    unsigned short port_;
    boost::asio::io_context io_context_;
};

std::vector<transfer::TransferResult> send_files(const std::string& host, unsigned short port,
                                                 const std::vector<std::string>& filepaths,
                                                 const ClientCallbacks& callbacks = {},
                                                 BatchPolicy policy = BatchPolicy::CONTINUE_ON_ERROR);

// Serves until SIGINT/SIGTERM. Returns false if the listener could not start.
bool run_server(const std::string& host, unsigned short port, const std::string& receive_dir,
                const ServerCallbacks& callbacks = {});

std::string format_size(uint64_t bytes);

} // namespace networking
