#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "log.hpp"

// Sidecar record describing how a file was cut into chunks.
struct Manifest {
  std::string name;   // original file name, used on reconstruction
  int64_t size = 0;
  std::string hash;   // SHA-256 of the whole file, also the namespace name
  std::vector<std::string> chunks; // in file byte order
};

// Content-addressed chunk storage: <root>/<hash>/chunk_<n> plus
// <root>/<hash>/manifest.json. Distinct chunk ids never share a path, so
// concurrent writers into one namespace do not collide.
class ChunkStore {
public:
  static constexpr std::size_t kChunkSize = 1024 * 1024;
  static constexpr const char* kManifestName = "manifest.json";

  explicit ChunkStore(std::filesystem::path root, std::shared_ptr<Logger> logger = nullptr);

  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path namespace_dir(const std::string& hash) const;

  // Cuts file_path into kChunkSize pieces under content_hash and writes the
  // manifest. Each chunk file is replaced atomically.
  Manifest split(const std::filesystem::path& file_path, const std::string& content_hash);

  // Concatenates the namespace's chunks in manifest order into
  // <output_dir>/<manifest name>. Returns the written path.
  std::filesystem::path reconstruct(const std::filesystem::path& output_dir,
                                    const std::string& content_hash);

  std::string read_chunk(const std::string& hash, const std::string& chunk_id) const;
  void write_chunk(const std::string& hash, const std::string& chunk_id, const std::string& data);

  void write_manifest(const Manifest& manifest);
  Manifest load_manifest(const std::string& hash) const;
  bool has_manifest(const std::string& hash) const;

  void remove_namespace(const std::string& hash);

  static std::string chunk_id_for_index(std::size_t index);
  static bool is_valid_chunk_id(const std::string& chunk_id);

private:
  std::filesystem::path chunk_path(const std::string& hash, const std::string& chunk_id) const;

  std::filesystem::path root_;
  std::shared_ptr<Logger> logger_;
};
