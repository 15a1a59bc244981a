#pragma once
#include <asio.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "chunk_store.hpp"
#include "log.hpp"
#include "request_handler.hpp"

// Accepts peers and hands each socket to its own Connection. The number of
// simultaneous connections is not limited.
class Server {
public:
    struct Options {
        std::string listen_ip = "127.0.0.1";
        unsigned short listen_port = 0; // 0 = ephemeral
        std::size_t io_threads = 2;
        std::filesystem::path share_dir = "shared";
        std::filesystem::path chunk_dir = "chunks";
    };

    Server(Options options, std::shared_ptr<Logger> logger = nullptr);
    ~Server();

    // Binds and starts accepting; does not run the event loop.
    void start();
    // Runs the event loop on the calling thread plus io_threads - 1 helpers
    // until stop().
    void run();
    // Runs the event loop on io_threads background threads.
    void start_background();
    void stop();

    unsigned short listen_port() const { return listen_port_; }
    std::size_t open_connections() const { return open_connections_.load(); }
    std::shared_ptr<Logger> logger() const { return logger_; }

private:
    using tcp = asio::ip::tcp;

    void do_accept();
    void spawn_threads(std::size_t count);

    Options options_;
    std::shared_ptr<Logger> logger_;
    // Connections still queued in io_ touch the counter when io_ tears them
    // down, so it must outlive io_.
    std::atomic<bool> started_{false};
    std::atomic<std::size_t> open_connections_{0};
    std::atomic<std::uint64_t> next_connection_id_{1};
    asio::io_context io_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    std::shared_ptr<const RequestHandler> handler_;
    std::vector<std::thread> threads_;
    unsigned short listen_port_ = 0;
};
