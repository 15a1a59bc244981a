#include "chunk_store.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <fstream>
#include <iterator>

#include "errors.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

nlohmann::json manifest_to_json(const Manifest& manifest) {
  nlohmann::json j;
  j["name"] = manifest.name;
  j["size"] = manifest.size;
  j["hash"] = manifest.hash;
  j["chunks"] = manifest.chunks;
  return j;
}

Manifest manifest_from_json(const nlohmann::json& j) {
  Manifest manifest;
  manifest.name = j.at("name").get<std::string>();
  manifest.size = j.at("size").get<int64_t>();
  manifest.hash = j.at("hash").get<std::string>();
  manifest.chunks = j.at("chunks").get<std::vector<std::string>>();
  return manifest;
}

std::atomic<uint64_t> g_temp_counter{0};

// Writes through a uniquely named sibling and renames it into place, so a
// concurrent reader sees either the old complete file or the new one.
void replace_file(const fs::path& path, const char* data, std::size_t size) {
  const fs::path temp = path.parent_path() /
    (path.filename().string() + ".tmp" + std::to_string(g_temp_counter.fetch_add(1)));
  {
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    out.write(data, static_cast<std::streamsize>(size));
    out.close();
    if(!out) {
      std::error_code ec;
      fs::remove(temp, ec);
      throw TransferError(ErrorKind::StorageFailure, "cannot write " + path.string());
    }
  }
  std::error_code ec;
  fs::rename(temp, path, ec);
  if(ec) {
    fs::remove(temp, ec);
    throw TransferError(ErrorKind::StorageFailure, "cannot move " + temp.string() + " into place");
  }
}

void require_hash(const std::string& hash) {
  if(!is_content_hash(hash)) {
    throw TransferError(ErrorKind::InvalidArgument, "not a content hash: '" + hash + "'");
  }
}

} // namespace

ChunkStore::ChunkStore(fs::path root, std::shared_ptr<Logger> logger)
  : root_(std::move(root)),
    logger_(std::move(logger)) {
  if(root_.empty()) root_ = "chunks";
}

fs::path ChunkStore::namespace_dir(const std::string& hash) const {
  require_hash(hash);
  return root_ / hash;
}

std::string ChunkStore::chunk_id_for_index(std::size_t index) {
  return "chunk_" + std::to_string(index);
}

bool ChunkStore::is_valid_chunk_id(const std::string& chunk_id) {
  if(chunk_id.empty() || chunk_id == "." || chunk_id == "..") return false;
  if(chunk_id == kManifestName) return false;
  return std::all_of(chunk_id.begin(), chunk_id.end(), [](unsigned char c){
    return std::isalnum(c) || c == '_' || c == '-' || c == '.';
  });
}

fs::path ChunkStore::chunk_path(const std::string& hash, const std::string& chunk_id) const {
  if(!is_valid_chunk_id(chunk_id)) {
    throw TransferError(ErrorKind::InvalidArgument, "invalid chunk id '" + chunk_id + "'");
  }
  return namespace_dir(hash) / chunk_id;
}

Manifest ChunkStore::split(const fs::path& file_path, const std::string& content_hash) {
  std::error_code ec;
  if(!fs::is_regular_file(file_path, ec)) {
    throw TransferError(ErrorKind::StorageFailure, "not a regular file: " + file_path.string());
  }
  std::ifstream in(file_path, std::ios::binary);
  if(!in) {
    throw TransferError(ErrorKind::StorageFailure, "cannot open " + file_path.string());
  }

  // Same hash means same bytes, so chunks already present are rewritten in
  // place rather than removed first; readers of this namespace stay valid.
  const fs::path dir = namespace_dir(content_hash);
  fs::create_directories(dir, ec);
  if(ec) {
    throw TransferError(ErrorKind::StorageFailure,
                        "cannot create chunk directory " + dir.string() + ": " + ec.message());
  }

  Manifest manifest;
  manifest.name = file_path.filename().string();
  manifest.hash = content_hash;

  std::string buffer(kChunkSize, '\0');
  for(std::size_t index = 0;; ++index) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto got = in.gcount();
    if(in.bad()) {
      throw TransferError(ErrorKind::StorageFailure, "read error on " + file_path.string());
    }
    if(got <= 0) break;

    const std::string chunk_id = chunk_id_for_index(index);
    replace_file(dir / chunk_id, buffer.data(), static_cast<std::size_t>(got));
    manifest.chunks.push_back(chunk_id);
    manifest.size += got;
    if(got < static_cast<std::streamsize>(buffer.size())) break;
  }

  write_manifest(manifest);
  log_debug(logger_.get(), "split {} into {} chunk(s) under {}",
            file_path.string(), manifest.chunks.size(), content_hash);
  return manifest;
}

fs::path ChunkStore::reconstruct(const fs::path& output_dir, const std::string& content_hash) {
  Manifest manifest = load_manifest(content_hash);
  if(manifest.name.empty()) {
    throw TransferError(ErrorKind::StorageFailure, "manifest for " + content_hash + " has no file name");
  }
  const fs::path name = fs::path(manifest.name).filename();
  if(name.empty() || name == "." || name == "..") {
    throw TransferError(ErrorKind::StorageFailure, "manifest file name '" + manifest.name + "' is not usable");
  }

  std::error_code ec;
  fs::create_directories(output_dir, ec);
  if(ec) {
    throw TransferError(ErrorKind::StorageFailure,
                        "cannot create output directory " + output_dir.string() + ": " + ec.message());
  }

  const fs::path final_path = output_dir / name;
  const fs::path partial_path = output_dir / (name.string() + ".part");
  {
    std::ofstream out(partial_path, std::ios::binary | std::ios::trunc);
    if(!out) {
      throw TransferError(ErrorKind::StorageFailure, "cannot create " + partial_path.string());
    }
    try {
      for(const auto& chunk_id : manifest.chunks) {
        std::string data = read_chunk(content_hash, chunk_id);
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        if(!out) {
          throw TransferError(ErrorKind::StorageFailure, "write failed on " + partial_path.string());
        }
      }
      out.close();
      if(!out) {
        throw TransferError(ErrorKind::StorageFailure, "close failed on " + partial_path.string());
      }
    } catch(const TransferError&) {
      out.close();
      fs::remove(partial_path, ec);
      throw;
    }
  }

  fs::rename(partial_path, final_path, ec);
  if(ec) {
    fs::remove(partial_path, ec);
    throw TransferError(ErrorKind::StorageFailure, "cannot move reconstructed file into " + final_path.string());
  }
  log_debug(logger_.get(), "reconstructed {} from {} chunk(s)", final_path.string(), manifest.chunks.size());
  return final_path;
}

std::string ChunkStore::read_chunk(const std::string& hash, const std::string& chunk_id) const {
  const fs::path path = chunk_path(hash, chunk_id);
  std::ifstream in(path, std::ios::binary);
  if(!in) {
    throw TransferError(ErrorKind::StorageFailure, "cannot open chunk " + path.string());
  }
  std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if(in.bad()) {
    throw TransferError(ErrorKind::StorageFailure, "read error on chunk " + path.string());
  }
  return data;
}

void ChunkStore::write_chunk(const std::string& hash, const std::string& chunk_id, const std::string& data) {
  const fs::path path = chunk_path(hash, chunk_id);
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if(ec) {
    throw TransferError(ErrorKind::StorageFailure,
                        "cannot create chunk directory " + path.parent_path().string() + ": " + ec.message());
  }
  replace_file(path, data.data(), data.size());
}

void ChunkStore::write_manifest(const Manifest& manifest) {
  const fs::path dir = namespace_dir(manifest.hash);
  std::error_code ec;
  fs::create_directories(dir, ec);
  const std::string text = manifest_to_json(manifest).dump(2);
  replace_file(dir / kManifestName, text.data(), text.size());
}

Manifest ChunkStore::load_manifest(const std::string& hash) const {
  const fs::path path = namespace_dir(hash) / kManifestName;
  std::ifstream in(path);
  if(!in) {
    throw TransferError(ErrorKind::StorageFailure, "no manifest at " + path.string());
  }
  try {
    nlohmann::json doc;
    in >> doc;
    return manifest_from_json(doc);
  } catch(const nlohmann::json::exception& e) {
    throw TransferError(ErrorKind::StorageFailure, "corrupt manifest " + path.string() + ": " + e.what());
  }
}

bool ChunkStore::has_manifest(const std::string& hash) const {
  std::error_code ec;
  return fs::is_regular_file(namespace_dir(hash) / kManifestName, ec);
}

void ChunkStore::remove_namespace(const std::string& hash) {
  std::error_code ec;
  fs::remove_all(namespace_dir(hash), ec);
  if(ec) {
    throw TransferError(ErrorKind::StorageFailure, "cannot clear " + namespace_dir(hash).string() + ": " + ec.message());
  }
}
