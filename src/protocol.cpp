#include "protocol.hpp"

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "utils.hpp"

using json = nlohmann::json;

namespace {

struct TypeTag {
  MessageType type;
  const char* name;
};

constexpr TypeTag kTypeTags[] = {
  {MessageType::CatalogRequest,       "CatalogRequest"},
  {MessageType::CatalogResponse,      "CatalogResponse"},
  {MessageType::FileMetadataRequest,  "FileMetadataRequest"},
  {MessageType::FileMetadataResponse, "FileMetadataResponse"},
  {MessageType::ChunkRequest,         "ChunkRequest"},
  {MessageType::ChunkResponse,        "ChunkResponse"},
};

json file_entry_to_json(const FileEntry& entry){
  json j;
  j["name"] = entry.name;
  j["size"] = entry.size;
  j["hash"] = entry.hash;
  j["chunks"] = entry.chunks;
  return j;
}

FileEntry file_entry_from_json(const json& j){
  FileEntry entry;
  entry.name = j.at("name").get<std::string>();
  entry.size = j.at("size").get<int64_t>();
  if(entry.size < 0) {
    throw TransferError(ErrorKind::MalformedMessage, "negative file size for " + entry.name);
  }
  entry.hash = j.at("hash").get<std::string>();
  entry.chunks = j.at("chunks").get<std::vector<std::string>>();
  return entry;
}

struct PayloadEncoder {
  json operator()(const CatalogRequest&) const { return json::object(); }

  json operator()(const CatalogResponse& m) const {
    json files = json::array();
    for(const auto& entry : m.catalog.files) files.push_back(file_entry_to_json(entry));
    json j;
    j["files"] = std::move(files);
    return j;
  }

  json operator()(const FileMetadataRequest& m) const {
    json j;
    j["file_name"] = m.file_name;
    return j;
  }

  json operator()(const FileMetadataResponse& m) const {
    json j;
    j["file_name"] = m.file_name;
    j["hash"] = m.hash;
    j["chunks"] = m.chunks;
    return j;
  }

  json operator()(const ChunkRequest& m) const {
    json j;
    j["file_hash"] = m.file_hash;
    j["chunk_id"] = m.chunk_id;
    return j;
  }

  json operator()(const ChunkResponse& m) const {
    json j;
    j["file_hash"] = m.file_hash;
    j["chunk_id"] = m.chunk_id;
    j["data"] = base64_encode(m.data);
    j["hash"] = m.hash;
    return j;
  }
};

Message decode_payload(MessageType type, const json& payload){
  switch(type) {
    case MessageType::CatalogRequest:
      return CatalogRequest{};
    case MessageType::CatalogResponse: {
      CatalogResponse m;
      const json& files = payload.at("files");
      if(!files.is_array()) {
        throw TransferError(ErrorKind::MalformedMessage, "catalog files is not an array");
      }
      for(const auto& item : files) {
        m.catalog.files.push_back(file_entry_from_json(item));
      }
      return m;
    }
    case MessageType::FileMetadataRequest: {
      FileMetadataRequest m;
      m.file_name = payload.at("file_name").get<std::string>();
      return m;
    }
    case MessageType::FileMetadataResponse: {
      FileMetadataResponse m;
      m.file_name = payload.at("file_name").get<std::string>();
      m.hash = payload.value("hash", "");
      m.chunks = payload.at("chunks").get<std::vector<std::string>>();
      return m;
    }
    case MessageType::ChunkRequest: {
      ChunkRequest m;
      m.file_hash = payload.value("file_hash", "");
      m.chunk_id = payload.at("chunk_id").get<std::string>();
      return m;
    }
    case MessageType::ChunkResponse: {
      ChunkResponse m;
      m.file_hash = payload.value("file_hash", "");
      m.chunk_id = payload.at("chunk_id").get<std::string>();
      m.data = base64_decode(payload.at("data").get<std::string>());
      m.hash = payload.at("hash").get<std::string>();
      return m;
    }
  }
  throw TransferError(ErrorKind::MalformedMessage, "unhandled message type");
}

} // namespace

MessageType message_type(const Message& message){
  return static_cast<MessageType>(message.index());
}

const char* message_type_name(MessageType type){
  for(const auto& tag : kTypeTags) {
    if(tag.type == type) return tag.name;
  }
  return "Unknown";
}

std::string encode_message(const Message& message){
  std::string out;
  try {
    json j;
    j["type"] = message_type_name(message_type(message));
    j["payload"] = std::visit(PayloadEncoder{}, message);
    out = j.dump();
  } catch(const json::exception& e) {
    throw TransferError(ErrorKind::EncodingFailure,
                        std::string("cannot encode ") + message_type_name(message_type(message)) + ": " + e.what());
  }
  if(out.find(kMessageTerminator) != std::string::npos) {
    throw TransferError(ErrorKind::EncodingFailure, "encoded message contains the line terminator");
  }
  return out;
}

std::string frame_message(const Message& message){
  std::string out = encode_message(message);
  out.push_back(kMessageTerminator);
  return out;
}

Message decode_message(std::string_view line){
  while(!line.empty() && (line.back() == kMessageTerminator || line.back() == '\r')) {
    line.remove_suffix(1);
  }
  if(line.empty()) {
    throw TransferError(ErrorKind::MalformedMessage, "empty message");
  }
  try {
    json j = json::parse(line.begin(), line.end());
    if(!j.is_object()) {
      throw TransferError(ErrorKind::MalformedMessage, "message is not a JSON object");
    }
    const std::string tag = j.at("type").get<std::string>();
    const TypeTag* found = nullptr;
    for(const auto& candidate : kTypeTags) {
      if(tag == candidate.name) {
        found = &candidate;
        break;
      }
    }
    if(!found) {
      throw TransferError(ErrorKind::MalformedMessage, "unknown message type '" + tag + "'");
    }
    const json payload = j.contains("payload") && !j["payload"].is_null()
      ? j["payload"]
      : json::object();
    if(!payload.is_object()) {
      throw TransferError(ErrorKind::MalformedMessage, "payload of " + tag + " is not an object");
    }
    return decode_payload(found->type, payload);
  } catch(const json::exception& e) {
    throw TransferError(ErrorKind::MalformedMessage, std::string("cannot decode message: ") + e.what());
  }
}

ChunkResponse make_chunk_response(const std::string& file_hash,
                                  const std::string& chunk_id,
                                  std::string data){
  ChunkResponse response;
  response.file_hash = file_hash;
  response.chunk_id = chunk_id;
  response.hash = sha256_hex(data);
  response.data = std::move(data);
  return response;
}
