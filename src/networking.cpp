#include "networking.hpp"
#include "session.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>
#include <cstdio>
#include <filesystem>
#include <sys/socket.h>

using boost::asio::ip::tcp;

namespace networking {

std::string format_size(uint64_t bytes) {
    double size = bytes;
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int i = 0;
    while (size >= 1024 && i < 4) {
        size /= 1024;
        i++;
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f %s", size, units[i]);
    return std::string(buf);
}

// ─── Server ─────────────────────────────────────────────────────────────────

namespace {

constexpr std::chrono::milliseconds kAcceptRetryDelay{10};
constexpr std::chrono::milliseconds kMaxAcceptRetryDelay{500};
constexpr unsigned int kAcceptErrorReportEvery = 50;

} // namespace

Server::Server(ServerConfig config, ServerCallbacks callbacks)
    : config_(std::move(config)), callbacks_(std::move(callbacks)), acceptor_(io_context_) {}

Server::~Server() {
    stop();
}

void Server::status(const std::string& text) const {
    if (callbacks_.on_status) callbacks_.on_status(text);
}

unsigned short Server::port() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return local_endpoint_.port();
}

std::size_t Server::active_sessions() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return session_threads_;
}

bool Server::run() {
    try {
        std::filesystem::create_directories(config_.receive_dir);

        tcp::resolver resolver(io_context_);
        tcp::endpoint endpoint = *resolver.resolve(config_.host, std::to_string(config_.port)).begin();
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
    } catch (const std::exception& e) {
        std::string msg = "Failed to start server on " + config_.host + ":" + std::to_string(config_.port) +
                          ": " + e.what();
        if (callbacks_.on_error) {
            callbacks_.on_error(msg);
        } else {
            std::cerr << msg << "\n";
        }
        boost::system::error_code ec;
        acceptor_.close(ec);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        local_endpoint_ = acceptor_.local_endpoint();
    }
    running_ = true;
    if (callbacks_.on_ready) callbacks_.on_ready(config_.host, port());
    status("Server listening on " + config_.host + ":" + std::to_string(port()));
    status("Files will be saved to: " + std::filesystem::absolute(config_.receive_dir).string());

    unsigned int failures = 0;
    while (!stop_requested_) {
        auto socket = std::make_shared<tcp::socket>(io_context_);
        boost::system::error_code ec;
        acceptor_.accept(*socket, ec);
        if (stop_requested_) break;
        if (ec == boost::asio::error::operation_aborted || ec == boost::asio::error::bad_descriptor) {
            break;
        }
        if (ec) {
            // Persistent errors such as EMFILE would otherwise spin
            ++failures;
            if (failures == 1 || failures % kAcceptErrorReportEvery == 0) {
                status("Socket error: " + ec.message() + " (attempt " + std::to_string(failures) + ")");
            }
            std::chrono::milliseconds pause = kAcceptRetryDelay * failures;
            std::this_thread::sleep_for(std::min(pause, kMaxAcceptRetryDelay));
            continue;
        }
        failures = 0;
        spawn_session(std::move(socket));
    }

    boost::system::error_code ec;
    acceptor_.close(ec);

    std::unique_lock<std::mutex> lock(sessions_mutex_);
    for (const auto& socket : sessions_) {
        ::shutdown(socket->native_handle(), SHUT_RDWR);
    }
    sessions_cv_.wait(lock, [this] { return session_threads_ == 0; });
    running_ = false;
    status("Server stopped");
    return true;
}

void Server::spawn_session(std::shared_ptr<tcp::socket> socket) {
    boost::system::error_code ec;
    tcp::endpoint remote = socket->remote_endpoint(ec);
    std::string peer = ec ? std::string("unknown peer")
                          : remote.address().to_string() + ":" + std::to_string(remote.port());

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.insert(socket);
        ++session_threads_;
    }

    std::thread([this, socket, peer]() mutable {
        status("New connection from " + peer);

        transfer::TransferResult result;
        {
            transfer::SessionCallbacks session_callbacks;
            session_callbacks.on_status = callbacks_.on_status;
            session_callbacks.on_progress = callbacks_.on_progress;

            transfer::ReceiverSession session(*socket, config_.receive_dir, session_callbacks);
            result = session.run();
        }

        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            sessions_.erase(socket);
            transfer::close_quietly(*socket);
        }
        // The socket belongs to io_context_ and must not outlive the server
        socket.reset();

        try {
            if (callbacks_.on_complete) callbacks_.on_complete(result);
            status("Connection with " + peer + " closed");
        } catch (const std::exception& e) {
            std::cerr << "Server: callback failed: " << e.what() << "\n";
        }

        std::lock_guard<std::mutex> lock(sessions_mutex_);
        --session_threads_;
        sessions_cv_.notify_all();
    }).detach();
}

void Server::wake_acceptor() {
    tcp::endpoint target;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        target = local_endpoint_;
    }
    if (target.address().is_unspecified()) {
        target.address(target.address().is_v6()
                           ? boost::asio::ip::address(boost::asio::ip::address_v6::loopback())
                           : boost::asio::ip::address(boost::asio::ip::address_v4::loopback()));
    }

    boost::asio::io_context io;
    tcp::socket poke(io);
    boost::system::error_code ec;
    poke.connect(target, ec);
    poke.close(ec);
}

void Server::stop() {
    if (stop_requested_.exchange(true)) return;
    if (running_) {
        wake_acceptor();
    }
}

// ─── Client ─────────────────────────────────────────────────────────────────

Client::Client(std::string host, unsigned short port) : host_(std::move(host)), port_(port) {}

transfer::TransferResult Client::send_file(const std::string& filepath, const ClientCallbacks& callbacks) {
    if (callbacks.on_status) {
        callbacks.on_status("Connecting to " + host_ + ":" + std::to_string(port_) + "...");
    }

    transfer::SessionCallbacks session_callbacks;
    session_callbacks.on_status = callbacks.on_status;
    session_callbacks.on_progress = callbacks.on_progress;

    transfer::SenderSession session(io_context_, host_, port_, filepath, session_callbacks);
    transfer::TransferResult result = session.run();

    if (callbacks.on_complete) callbacks.on_complete(result);
    return result;
}

std::vector<transfer::TransferResult> Client::send_files(const std::vector<std::string>& filepaths,
                                                         const ClientCallbacks& callbacks, BatchPolicy policy) {
    std::vector<transfer::TransferResult> results;
    results.reserve(filepaths.size());

    for (const auto& filepath : filepaths) {
        results.push_back(send_file(filepath, callbacks));
        if (!results.back().ok() && policy == BatchPolicy::STOP_ON_ERROR) {
            break;
        }
    }
    return results;
}

std::vector<transfer::TransferResult> send_files(const std::string& host, unsigned short port,
                                                 const std::vector<std::string>& filepaths,
                                                 const ClientCallbacks& callbacks, BatchPolicy policy) {
    Client client(host, port);
    return client.send_files(filepaths, callbacks, policy);
}

bool run_server(const std::string& host, unsigned short port, const std::string& receive_dir,
                const ServerCallbacks& callbacks) {
    Server server(ServerConfig{host, port, receive_dir}, callbacks);

    boost::asio::io_context signal_io;
    boost::asio::signal_set signals(signal_io, SIGINT, SIGTERM);
    signals.async_wait([&server](const boost::system::error_code& ec, int /*signo*/) {
        if (!ec) server.stop();
    });
    std::thread signal_thread([&signal_io]() { signal_io.run(); });

    bool ok = server.run();

    signal_io.stop();
    signal_thread.join();
    return ok;
}

} // namespace networking
