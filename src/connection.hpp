#pragma once
#include <asio.hpp>
#include <functional>
#include <memory>
#include <string>

#include "log.hpp"
#include "protocol.hpp"
#include "request_handler.hpp"

// Server side of one accepted socket: read a line, decode, dispatch, write
// the response, repeat until the peer goes away. Requests on one connection
// are served in order; separate connections run concurrently.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using CloseCallback = std::function<void()>;

    // Upper bound on a single request line; requests are small.
    static constexpr std::size_t kMaxRequestBytes = 1024 * 1024;

    static std::shared_ptr<Connection> create(asio::ip::tcp::socket sock,
                                              std::shared_ptr<const RequestHandler> handler,
                                              std::shared_ptr<Logger> logger,
                                              CloseCallback on_close = {});

    ~Connection();

    void start();

    const std::string& remote() const { return remote_; }

private:
    Connection(asio::ip::tcp::socket sock,
               std::shared_ptr<const RequestHandler> handler,
               std::shared_ptr<Logger> logger,
               CloseCallback on_close);
    void do_read();
    void handle_line(std::string line);
    void do_write(std::string framed);
    void close();

    asio::ip::tcp::socket socket_;
    std::shared_ptr<const RequestHandler> handler_;
    std::shared_ptr<Logger> logger_;
    CloseCallback on_close_;
    asio::streambuf read_buf_;
    std::string write_buf_;
    std::string remote_;
    // Set while the tail of an oversized line is still arriving.
    bool discarding_line_ = false;
};
