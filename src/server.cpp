#include "server.hpp"
#include "connection.hpp"

#include <stdexcept>

Server::Server(Options options, std::shared_ptr<Logger> logger)
: options_(std::move(options)),
  logger_(logger ? std::move(logger) : std::make_shared<Logger>("server"))
{
    if(options_.io_threads == 0) options_.io_threads = 1;
}

Server::~Server(){
    stop();
}

void Server::start(){
    if(started_) return;

    std::error_code ec;
    if(!std::filesystem::is_directory(options_.share_dir, ec)){
        logger_->error("Shared directory {} does not exist", options_.share_dir.string());
        throw std::runtime_error("shared directory not found: " + options_.share_dir.string());
    }

    auto store = std::make_shared<ChunkStore>(options_.chunk_dir, logger_->child("store"));
    handler_ = std::make_shared<const RequestHandler>(options_.share_dir, store, logger_->child("dispatch"));

    asio::ip::address listen_address;
    try {
        listen_address = asio::ip::make_address(options_.listen_ip);
    } catch(const std::exception& e) {
        logger_->error("Invalid listen_ip '{}': {}", options_.listen_ip, e.what());
        throw;
    }

    acceptor_ = std::make_unique<tcp::acceptor>(io_);
    tcp::endpoint endpoint(listen_address, options_.listen_port);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();
    listen_port_ = acceptor_->local_endpoint().port();

    started_ = true;
    logger_->info("Serving {} on {}:{}", options_.share_dir.string(), options_.listen_ip, listen_port_);
    do_accept();
}

void Server::do_accept(){
    if(!acceptor_) return;
    // Each accepted socket gets its own strand so a connection's handlers
    // never run concurrently with each other while connections stay parallel.
    acceptor_->async_accept(asio::make_strand(io_),
        [this](std::error_code ec, tcp::socket socket){
            if(ec){
                if(ec == asio::error::operation_aborted) return;
                logger_->error("Accept error: {}", ec.message());
            } else {
                auto id = next_connection_id_.fetch_add(1);
                ++open_connections_;
                auto conn = Connection::create(std::move(socket),
                                               handler_,
                                               logger_->child("conn-" + std::to_string(id)),
                                               [this]{ --open_connections_; });
                conn->start();
            }
            if(started_){
                do_accept();
            }
        });
}

void Server::spawn_threads(std::size_t count){
    for(std::size_t i = 0; i < count; ++i){
        threads_.emplace_back([this]{
            try {
                io_.run();
            } catch(const std::exception& e) {
                logger_->error("I/O thread stopped: {}", e.what());
            }
        });
    }
}

void Server::run(){
    if(!started_) start();
    spawn_threads(options_.io_threads - 1);
    io_.run();
}

void Server::start_background(){
    if(!started_) start();
    if(!threads_.empty()) return;
    spawn_threads(options_.io_threads);
}

void Server::stop(){
    if(!started_.exchange(false)){
        return;
    }
    if(acceptor_){
        std::error_code ec;
        acceptor_->close(ec);
    }
    io_.stop();
    for(auto& thread : threads_){
        if(thread.joinable()) thread.join();
    }
    threads_.clear();
    logger_->info("Server on port {} stopped", listen_port_);
}
