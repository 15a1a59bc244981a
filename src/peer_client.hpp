#pragma once
#include <asio.hpp>
#include <memory>
#include <string>

#include "catalog.hpp"
#include "log.hpp"
#include "protocol.hpp"

// One blocking connection to a remote node. Every call either returns the
// expected response or throws TransferError; nothing is retried.
class PeerClient {
public:
    explicit PeerClient(std::shared_ptr<Logger> logger = nullptr);
    ~PeerClient();

    PeerClient(const PeerClient&) = delete;
    PeerClient& operator=(const PeerClient&) = delete;

    void connect(const std::string& address);
    bool connected() const { return socket_.is_open(); }
    void close();
    const std::string& address() const { return address_; }

    void send(const Message& message);
    Message receive();
    Message request(const Message& message);

    Catalog fetch_catalog();
    FileMetadataResponse fetch_file_metadata(const std::string& file_name);
    // Raw ChunkResponse for chunk_id; the payload is not verified.
    ChunkResponse request_chunk(const std::string& file_hash, const std::string& chunk_id);
    // request_chunk() followed by verify_chunk().
    ChunkResponse fetch_chunk(const std::string& file_hash, const std::string& chunk_id);

private:
    asio::io_context io_;
    asio::ip::tcp::socket socket_;
    asio::streambuf read_buf_;
    std::string address_;
    std::shared_ptr<Logger> logger_;
};

// Throws TransferError(IntegrityFailure) unless SHA-256(data) equals hash.
void verify_chunk(const ChunkResponse& chunk);

Catalog fetch_catalog(const std::string& address, std::shared_ptr<Logger> logger = nullptr);
