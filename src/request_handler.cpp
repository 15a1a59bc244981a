#include "request_handler.hpp"

#include <algorithm>

#include "errors.hpp"

RequestHandler::RequestHandler(std::filesystem::path share_dir,
                               std::shared_ptr<ChunkStore> store,
                               std::shared_ptr<Logger> logger)
  : share_dir_(std::move(share_dir)),
    store_(std::move(store)),
    logger_(std::move(logger)) {}

std::optional<Message> RequestHandler::handle(const Message& request) const {
  switch(message_type(request)) {
    case MessageType::CatalogRequest:
      return on_catalog_request();
    case MessageType::FileMetadataRequest:
      return on_file_metadata_request(std::get<FileMetadataRequest>(request));
    case MessageType::ChunkRequest:
      return on_chunk_request(std::get<ChunkRequest>(request));
    default:
      log_warn(logger_.get(), "Ignoring unexpected {} from peer",
               message_type_name(message_type(request)));
      return std::nullopt;
  }
}

std::optional<Catalog> RequestHandler::current_catalog() const {
  try {
    return build_catalog(share_dir_, *store_, logger_.get());
  } catch(const TransferError& e) {
    log_error(logger_.get(), "Catalog build failed ({}): {}", error_kind_name(e.kind()), e.what());
  } catch(const std::filesystem::filesystem_error& e) {
    log_error(logger_.get(), "Catalog build failed: {}", e.what());
  }
  return std::nullopt;
}

std::optional<Message> RequestHandler::on_catalog_request() const {
  auto catalog = current_catalog();
  if(!catalog) return std::nullopt;
  log_debug(logger_.get(), "Serving catalog with {} file(s)", catalog->files.size());
  return CatalogResponse{std::move(*catalog)};
}

std::optional<Message> RequestHandler::on_file_metadata_request(const FileMetadataRequest& request) const {
  auto catalog = current_catalog();
  if(!catalog) return std::nullopt;

  FileMetadataResponse response;
  response.file_name = request.file_name;
  if(auto entry = find_entry_by_name(*catalog, request.file_name)) {
    response.hash = entry->hash;
    response.chunks = std::move(entry->chunks);
  } else {
    log_info(logger_.get(), "Metadata requested for unknown file '{}'", request.file_name);
  }
  return response;
}

std::optional<Message> RequestHandler::on_chunk_request(const ChunkRequest& request) const {
  auto catalog = current_catalog();
  if(!catalog) return std::nullopt;

  auto entry = request.file_hash.empty()
    ? find_entry_by_chunk(*catalog, request.chunk_id)
    : find_entry(*catalog, request.file_hash);
  if(!entry) {
    log_warn(logger_.get(), "Dropping request for chunk {} of unhosted file '{}'",
             request.chunk_id, request.file_hash);
    return std::nullopt;
  }
  if(std::find(entry->chunks.begin(), entry->chunks.end(), request.chunk_id) == entry->chunks.end()) {
    log_warn(logger_.get(), "Dropping request for unknown chunk {} of {}", request.chunk_id, entry->name);
    return std::nullopt;
  }

  try {
    std::string data = store_->read_chunk(entry->hash, request.chunk_id);
    log_debug(logger_.get(), "Serving {} ({} bytes) of {}", request.chunk_id, data.size(), entry->name);
    return make_chunk_response(entry->hash, request.chunk_id, std::move(data));
  } catch(const TransferError& e) {
    log_error(logger_.get(), "Cannot read chunk {} of {}: {}", request.chunk_id, entry->hash, e.what());
  }
  return std::nullopt;
}
