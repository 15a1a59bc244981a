#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include "chunk_store.hpp"
#include "log.hpp"
#include "protocol.hpp"

// Routes one decoded request to its handler. Holds no per-connection or
// cross-request state: every request re-reads the shared directory.
class RequestHandler {
public:
  RequestHandler(std::filesystem::path share_dir,
                 std::shared_ptr<ChunkStore> store,
                 std::shared_ptr<Logger> logger = nullptr);

  // Returns the response to send, or nullopt when the request is dropped
  // (the reason has been logged).
  std::optional<Message> handle(const Message& request) const;

  const std::filesystem::path& share_dir() const { return share_dir_; }

private:
  std::optional<Message> on_catalog_request() const;
  std::optional<Message> on_file_metadata_request(const FileMetadataRequest& request) const;
  std::optional<Message> on_chunk_request(const ChunkRequest& request) const;

  std::optional<Catalog> current_catalog() const;

  std::filesystem::path share_dir_;
  std::shared_ptr<ChunkStore> store_;
  std::shared_ptr<Logger> logger_;
};
