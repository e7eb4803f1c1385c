#include <iostream>
#include <iomanip>
#include <sstream>
#include <chrono>
#include <string>
#include <cstdint>
#include <thread>
#include <vector>
#include "networking.hpp"
#include "event_queue.hpp"

namespace {

struct ConsoleEvent {
    enum class Kind { STATUS, PROGRESS, RESULT, ERROR } kind;
    std::string text;
};

void print_usage(const char* prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " send [--host HOST] [--port PORT] [--stop-on-error] [--quiet] FILE...\n"
              << "  " << prog << " serve [--host HOST] [--port PORT] [--receive-dir DIR] [--quiet]\n"
              << "\nDefaults: host " << networking::kDefaultHost << ", port " << networking::kDefaultPort
              << ", receive dir " << networking::kDefaultReceiveDir << "\n";
}

bool parse_port(const std::string& value, unsigned short& port) {
    try {
        size_t used = 0;
        unsigned long parsed = std::stoul(value, &used);
        if (used != value.size() || parsed > 65535) return false;
        port = static_cast<unsigned short>(parsed);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::string progress_line(const std::string& filename, uint64_t done, uint64_t total, double speed) {
    int percent = (total > 0) ? static_cast<int>((done * 100.0) / total) : 100;
    std::ostringstream oss;
    oss << "\r" << filename << ": " << percent << "% (" << networking::format_size(done) << "/"
        << networking::format_size(total) << ") | " << std::fixed << std::setprecision(1) << speed << " MB/s    ";
    return oss.str();
}

std::string describe(const transfer::TransferResult& result) {
    std::string name = result.filename.empty() ? result.path : result.filename;
    if (result.ok()) {
        return "Successfully transferred: " + name + " (" + std::to_string(result.bytes_transferred) + " bytes)";
    }
    return "Failed: " + name + " [" + transfer::to_string(result.error) + " after " +
           std::to_string(result.bytes_transferred) + "/" + std::to_string(result.total_bytes) + " bytes] " +
           result.detail;
}

int run_send(const networking::ClientConfig& config, const std::vector<std::string>& files, bool quiet) {
    networking::ClientCallbacks callbacks;
    callbacks.on_status = [](const std::string& msg) {
        std::cout << "\n" << msg << std::endl;
    };
    if (!quiet) {
        callbacks.on_progress = [](const std::string& filename, uint64_t done, uint64_t total, double speed) {
            std::cout << progress_line(filename, done, total, speed) << std::flush;
        };
    }
    callbacks.on_complete = [](const transfer::TransferResult& result) {
        if (result.ok()) {
            std::cout << describe(result) << "\n";
        } else {
            std::cerr << describe(result) << "\n";
        }
    };

    std::vector<transfer::TransferResult> results =
        networking::send_files(config.host, config.port, files, callbacks, config.policy);

    size_t succeeded = 0;
    for (const auto& r : results) {
        if (r.ok()) succeeded++;
    }
    std::cout << "\n" << succeeded << "/" << files.size() << " file(s) sent.\n";
    return (succeeded == files.size()) ? 0 : 1;
}

int run_serve(const networking::ServerConfig& config, bool quiet) {
    networking::EventQueue<ConsoleEvent> events(1024);

    networking::ServerCallbacks callbacks;
    callbacks.on_status = [&events](const std::string& msg) {
        events.push({ConsoleEvent::Kind::STATUS, msg});
    };
    if (!quiet) {
        callbacks.on_progress = [&events](const std::string& filename, uint64_t done, uint64_t total, double speed) {
            events.push({ConsoleEvent::Kind::PROGRESS, progress_line(filename, done, total, speed)});
        };
    }
    callbacks.on_complete = [&events](const transfer::TransferResult& result) {
        events.push({ConsoleEvent::Kind::RESULT, describe(result)});
    };
    callbacks.on_error = [&events](const std::string& err) {
        events.push({ConsoleEvent::Kind::ERROR, err});
    };

    std::cout << "Press Ctrl+C to stop the server\n";

    bool started = true;
    std::thread server_thread([&]() {
        started = networking::run_server(config.host, config.port, config.receive_dir, callbacks);
        events.close();
    });

    while (true) {
        auto event = events.wait_pop(std::chrono::milliseconds(200));
        if (!event) {
            if (events.closed()) break;
            continue;
        }
        switch (event->kind) {
        case ConsoleEvent::Kind::PROGRESS:
            std::cout << event->text << std::flush;
            break;
        case ConsoleEvent::Kind::ERROR:
            std::cerr << "\nERROR: " << event->text << "\n";
            break;
        default:
            std::cout << "\n" << event->text << std::endl;
        }
    }
    server_thread.join();

    if (events.dropped() > 0) {
        std::cout << "(" << events.dropped() << " progress update(s) skipped)\n";
    }
    return started ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 2;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        print_usage(argv[0]);
        return 0;
    }
    if (command != "send" && command != "serve") {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage(argv[0]);
        return 2;
    }

    networking::ServerConfig server_config;
    networking::ClientConfig client_config;
    std::vector<std::string> files;
    bool quiet = false;
    unsigned short port = networking::kDefaultPort;
    std::string host = networking::kDefaultHost;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) -> bool {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--host") {
            if (!next(host)) return 2;
        } else if (arg == "--port") {
            if (!next(value)) return 2;
            if (!parse_port(value, port)) {
                std::cerr << "Invalid port: " << value << "\n";
                return 2;
            }
        } else if (arg == "--receive-dir" && command == "serve") {
            if (!next(server_config.receive_dir)) return 2;
        } else if (arg == "--stop-on-error" && command == "send") {
            client_config.policy = networking::BatchPolicy::STOP_ON_ERROR;
        } else if (arg == "-q" || arg == "--quiet") {
            quiet = true;
        } else if (command == "send" && (arg.empty() || arg[0] != '-')) {
            files.push_back(arg);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 2;
        }
    }

    if (command == "send") {
        if (files.empty()) {
            std::cerr << "No files to send.\n";
            print_usage(argv[0]);
            return 2;
        }
        client_config.host = host;
        client_config.port = port;
        std::cout << "Total files to transfer: " << files.size() << "\n";
        return run_send(client_config, files, quiet);
    }

    server_config.host = host;
    server_config.port = port;
    return run_serve(server_config, quiet);
}
