#include "peer_client.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <istream>

namespace {

template<typename T>
T expect(Message message, const std::string& address){
    if(auto* typed = std::get_if<T>(&message)){
        return std::move(*typed);
    }
    throw TransferError(ErrorKind::MalformedMessage,
                        std::string("unexpected ") + message_type_name(message_type(message)) +
                        " from " + address);
}

} // namespace

PeerClient::PeerClient(std::shared_ptr<Logger> logger)
: socket_(io_), logger_(std::move(logger)) {}

PeerClient::~PeerClient(){
    close();
}

void PeerClient::connect(const std::string& address){
    close();
    HostPort target = parse_host_port(address);
    address_ = address;

    std::error_code ec;
    asio::ip::tcp::resolver resolver(io_);
    auto endpoints = resolver.resolve(target.host, std::to_string(target.port), ec);
    if(ec){
        log_error(logger_.get(), "Resolve failed for {}: {}", address, ec.message());
        throw TransferError(ErrorKind::ConnectionFailure, "cannot resolve " + address + ": " + ec.message());
    }
    asio::connect(socket_, endpoints, ec);
    if(ec){
        log_error(logger_.get(), "Failed to connect to peer at {}: {}", address, ec.message());
        throw TransferError(ErrorKind::ConnectionFailure, "cannot connect to " + address + ": " + ec.message());
    }
    read_buf_.consume(read_buf_.size());
    log_debug(logger_.get(), "Connected to peer at {}", address);
}

void PeerClient::close(){
    if(!socket_.is_open()) return;
    std::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

void PeerClient::send(const Message& message){
    if(!connected()){
        throw TransferError(ErrorKind::ConnectionFailure, "not connected");
    }
    const std::string framed = frame_message(message);
    std::error_code ec;
    asio::write(socket_, asio::buffer(framed), ec);
    if(ec){
        log_error(logger_.get(), "Write of {} to {} failed: {}",
                  message_type_name(message_type(message)), address_, ec.message());
        throw TransferError(ErrorKind::ConnectionFailure, "write to " + address_ + " failed: " + ec.message());
    }
}

Message PeerClient::receive(){
    if(!connected()){
        throw TransferError(ErrorKind::ConnectionFailure, "not connected");
    }
    std::error_code ec;
    asio::read_until(socket_, read_buf_, kMessageTerminator, ec);
    if(ec){
        log_error(logger_.get(), "Read from {} failed: {}", address_, ec.message());
        throw TransferError(ErrorKind::ConnectionFailure, "read from " + address_ + " failed: " + ec.message());
    }
    std::istream is(&read_buf_);
    std::string line;
    std::getline(is, line, kMessageTerminator);
    return decode_message(line);
}

Message PeerClient::request(const Message& message){
    send(message);
    return receive();
}

Catalog PeerClient::fetch_catalog(){
    auto response = expect<CatalogResponse>(request(CatalogRequest{}), address_);
    log_debug(logger_.get(), "Received catalog of {} file(s) from {}", response.catalog.files.size(), address_);
    return std::move(response.catalog);
}

FileMetadataResponse PeerClient::fetch_file_metadata(const std::string& file_name){
    return expect<FileMetadataResponse>(request(FileMetadataRequest{file_name}), address_);
}

ChunkResponse PeerClient::request_chunk(const std::string& file_hash, const std::string& chunk_id){
    auto chunk = expect<ChunkResponse>(request(ChunkRequest{file_hash, chunk_id}), address_);
    if(chunk.chunk_id != chunk_id){
        throw TransferError(ErrorKind::MalformedMessage,
                            "asked " + address_ + " for " + chunk_id + " but got " + chunk.chunk_id);
    }
    if(!chunk.file_hash.empty() && !file_hash.empty() && chunk.file_hash != file_hash){
        throw TransferError(ErrorKind::MalformedMessage,
                            "asked " + address_ + " for " + chunk_id + " of " + file_hash +
                            " but got one of " + chunk.file_hash);
    }
    return chunk;
}

ChunkResponse PeerClient::fetch_chunk(const std::string& file_hash, const std::string& chunk_id){
    auto chunk = request_chunk(file_hash, chunk_id);
    verify_chunk(chunk);
    return chunk;
}

void verify_chunk(const ChunkResponse& chunk){
    const std::string actual = sha256_hex(chunk.data);
    if(actual != chunk.hash){
        throw TransferError(ErrorKind::IntegrityFailure,
                            "integrity check failed for chunk " + chunk.chunk_id +
                            " (expected " + chunk.hash + ", got " + actual + ")");
    }
}

Catalog fetch_catalog(const std::string& address, std::shared_ptr<Logger> logger){
    PeerClient client(std::move(logger));
    client.connect(address);
    return client.fetch_catalog();
}
