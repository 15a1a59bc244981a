#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "chunk_store.hpp"
#include "log.hpp"

struct FileEntry {
    std::string name;
    int64_t size = 0;
    std::string hash; // hex SHA-256 of the whole file
    std::vector<std::string> chunks; // concatenated in this order they reproduce the file
};

struct Catalog {
    std::vector<FileEntry> files;
};

// Snapshot of the regular files directly under directory (subdirectories are
// skipped). Each file is hashed and re-split into its chunk namespace. The
// build is all-or-nothing: the first file that fails aborts it with a
// TransferError.
Catalog build_catalog(const std::filesystem::path& directory,
                      ChunkStore& store,
                      Logger* logger = nullptr);

std::optional<FileEntry> find_entry(const Catalog& catalog, const std::string& hash);
std::optional<FileEntry> find_entry_by_name(const Catalog& catalog, const std::string& name);

// First entry (catalog order) whose chunk list contains chunk_id.
std::optional<FileEntry> find_entry_by_chunk(const Catalog& catalog, const std::string& chunk_id);
