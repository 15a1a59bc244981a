#include "catalog.hpp"

#include <algorithm>

#include "errors.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

Catalog build_catalog(const fs::path& directory, ChunkStore& store, Logger* logger){
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if(ec){
        throw TransferError(ErrorKind::StorageFailure,
                            "cannot read directory " + directory.string() + ": " + ec.message());
    }

    std::vector<fs::path> files;
    for(const auto& entry : it){
        std::error_code type_ec;
        if(!entry.is_regular_file(type_ec)) continue;
        files.push_back(entry.path());
    }
    // Directory order is unspecified; keep catalogs stable between requests.
    std::sort(files.begin(), files.end());

    Catalog catalog;
    catalog.files.reserve(files.size());
    for(const auto& path : files){
        const std::string hash = sha256_file_hex(path);
        Manifest manifest = store.split(path, hash);

        FileEntry entry;
        entry.name = path.filename().string();
        entry.size = manifest.size;
        entry.hash = hash;
        entry.chunks = std::move(manifest.chunks);
        catalog.files.push_back(std::move(entry));
    }
    log_debug(logger, "catalog of {} holds {} file(s)", directory.string(), catalog.files.size());
    return catalog;
}

std::optional<FileEntry> find_entry(const Catalog& catalog, const std::string& hash){
    for(const auto& entry : catalog.files){
        if(entry.hash == hash) return entry;
    }
    return std::nullopt;
}

std::optional<FileEntry> find_entry_by_name(const Catalog& catalog, const std::string& name){
    for(const auto& entry : catalog.files){
        if(entry.name == name) return entry;
    }
    return std::nullopt;
}

std::optional<FileEntry> find_entry_by_chunk(const Catalog& catalog, const std::string& chunk_id){
    for(const auto& entry : catalog.files){
        if(std::find(entry.chunks.begin(), entry.chunks.end(), chunk_id) != entry.chunks.end()){
            return entry;
        }
    }
    return std::nullopt;
}
