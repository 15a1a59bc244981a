#include "connection.hpp"
#include "errors.hpp"

#include <istream>

std::shared_ptr<Connection> Connection::create(asio::ip::tcp::socket sock,
                                               std::shared_ptr<const RequestHandler> handler,
                                               std::shared_ptr<Logger> logger,
                                               CloseCallback on_close)
{
    return std::shared_ptr<Connection>(new Connection(std::move(sock),
                                                      std::move(handler),
                                                      std::move(logger),
                                                      std::move(on_close)));
}

Connection::Connection(asio::ip::tcp::socket sock,
                       std::shared_ptr<const RequestHandler> handler,
                       std::shared_ptr<Logger> logger,
                       CloseCallback on_close)
: socket_(std::move(sock)),
  handler_(std::move(handler)),
  logger_(std::move(logger)),
  on_close_(std::move(on_close)),
  read_buf_(kMaxRequestBytes)
{
    std::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    remote_ = ec ? std::string("unknown") : ep.address().to_string() + ":" + std::to_string(ep.port());
}

Connection::~Connection(){
    std::error_code ec;
    socket_.close(ec);
    log_debug(logger_.get(), "Connection handler for {} finished", remote_);
    if(on_close_) on_close_();
}

void Connection::start(){
    log_info(logger_.get(), "Peer connected: {}", remote_);
    do_read();
}

void Connection::do_read(){
    auto self = shared_from_this();
    asio::async_read_until(socket_, read_buf_, kMessageTerminator,
        [this, self](std::error_code ec, std::size_t){
            if(ec == asio::error::not_found){
                // The buffer filled up without a terminator. Drop what arrived
                // and skip the rest of that line on the next read.
                if(!discarding_line_){
                    log_warn(logger_.get(), "Skipping malformed message from {}: line exceeds {} bytes",
                             remote_, kMaxRequestBytes);
                }
                read_buf_.consume(read_buf_.size());
                discarding_line_ = true;
                do_read();
                return;
            }
            if(ec){
                if(ec == asio::error::eof || ec == asio::error::connection_reset){
                    log_info(logger_.get(), "Peer disconnected: {}", remote_);
                } else {
                    log_info(logger_.get(), "Connection read error from {}: {}", remote_, ec.message());
                }
                close();
                return;
            }
            std::istream is(&read_buf_);
            std::string line;
            std::getline(is, line, kMessageTerminator);
            if(discarding_line_){
                discarding_line_ = false;
                do_read();
                return;
            }
            if(line.empty() || line == "\r"){
                do_read();
                return;
            }
            handle_line(std::move(line));
        });
}

void Connection::handle_line(std::string line){
    Message request;
    try{
        request = decode_message(line);
    } catch(const TransferError& ex){
        log_warn(logger_.get(), "Skipping malformed message from {}: {}", remote_, ex.what());
        do_read();
        return;
    }

    std::optional<Message> response;
    try{
        response = handler_->handle(request);
    } catch(const std::exception& ex){
        log_error(logger_.get(), "Handler for {} from {} failed: {}",
                  message_type_name(message_type(request)), remote_, ex.what());
    }
    if(!response){
        do_read();
        return;
    }

    std::string framed;
    try{
        framed = frame_message(*response);
    } catch(const TransferError& ex){
        log_error(logger_.get(), "Dropping {} for {}: {}",
                  message_type_name(message_type(*response)), remote_, ex.what());
        do_read();
        return;
    }
    do_write(std::move(framed));
}

void Connection::do_write(std::string framed){
    write_buf_ = std::move(framed);
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(write_buf_),
        [this, self](std::error_code ec, std::size_t){
            if(ec){
                log_warn(logger_.get(), "Response write to {} failed: {}", remote_, ec.message());
            }
            write_buf_.clear();
            // A dead socket surfaces on the next read and ends the loop there.
            do_read();
        });
}

void Connection::close(){
    std::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}
