#pragma once
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "catalog.hpp"

// protocol.hpp
// One JSON document per line: {"type": "<tag>", "payload": {...}}.
inline constexpr char kMessageTerminator = '\n';

enum class MessageType {
  CatalogRequest,
  CatalogResponse,
  FileMetadataRequest,
  FileMetadataResponse,
  ChunkRequest,
  ChunkResponse
};

struct CatalogRequest {};

struct CatalogResponse {
  Catalog catalog;
};

struct FileMetadataRequest {
  std::string file_name;
};

// An empty chunk list means the name is not hosted.
struct FileMetadataResponse {
  std::string file_name;
  std::string hash;
  std::vector<std::string> chunks;
};

// file_hash names the chunk namespace; it may be empty for peers that only
// send the chunk id.
struct ChunkRequest {
  std::string file_hash;
  std::string chunk_id;
};

struct ChunkResponse {
  std::string file_hash;
  std::string chunk_id;
  std::string data;  // raw bytes; base64 on the wire
  std::string hash;  // hex SHA-256 of data, computed by the sender
};

// Alternative order matches MessageType.
using Message = std::variant<CatalogRequest,
                             CatalogResponse,
                             FileMetadataRequest,
                             FileMetadataResponse,
                             ChunkRequest,
                             ChunkResponse>;

MessageType message_type(const Message& message);
const char* message_type_name(MessageType type);

// Serialized form without the terminator. Throws TransferError(EncodingFailure)
// when a field cannot be represented (e.g. a name that is not valid UTF-8).
std::string encode_message(const Message& message);

// encode_message() plus the terminator, ready to write to a stream.
std::string frame_message(const Message& message);

// Accepts one line with or without its terminator. Throws
// TransferError(MalformedMessage) on anything that is not a well-formed
// message of a known type.
Message decode_message(std::string_view line);

ChunkResponse make_chunk_response(const std::string& file_hash,
                                  const std::string& chunk_id,
                                  std::string data);
