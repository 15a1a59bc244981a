#include "swarm_downloader.hpp"

#include <algorithm>
#include <atomic>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "catalog.hpp"
#include "chunk_store.hpp"
#include "peer_client.hpp"
#include "utils.hpp"

namespace {

constexpr std::size_t kMaxWorkers = 64;

bool fail(SwarmResult& result, ErrorKind kind, std::string reason, Logger* logger) {
  result.success = false;
  result.error = kind;
  result.failure_reason = std::move(reason);
  log_error(logger, "Download failed ({}): {}", error_kind_name(kind), result.failure_reason);
  return false;
}

bool is_plain_file_name(const std::string& name) {
  if(name.empty() || name == "." || name == "..") return false;
  return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

}

std::vector<std::size_t> assign_round_robin(std::size_t chunk_count, std::size_t server_count) {
  std::vector<std::size_t> assignment(chunk_count, 0);
  if(server_count == 0) return assignment;
  for(std::size_t i = 0; i < chunk_count; ++i) {
    assignment[i] = i % server_count;
  }
  return assignment;
}

SwarmFetcherFactory make_peer_fetcher_factory(std::shared_ptr<Logger> logger) {
  return [logger]() -> SwarmChunkFetcher {
    // Connections are opened lazily, one per distinct server this worker is
    // handed, and live as long as the worker's fetcher.
    auto clients = std::make_shared<std::unordered_map<std::string, std::unique_ptr<PeerClient>>>();
    return [clients, logger](const std::string& address,
                             const std::string& file_hash,
                             const std::string& chunk_id) {
      auto& client = (*clients)[address];
      if(!client) {
        client = std::make_unique<PeerClient>(logger);
      }
      if(!client->connected()) {
        client->connect(address);
      }
      return client->request_chunk(file_hash, chunk_id);
    };
  };
}

bool run_swarm_download(const std::string& content_hash,
                        const std::string& file_name,
                        const std::vector<std::string>& servers,
                        const SwarmConfig& config,
                        SwarmResult& result) {
  Logger* logger = config.logger.get();
  result = SwarmResult{};

  if(servers.empty()) {
    return fail(result, ErrorKind::InvalidArgument, "no servers given", logger);
  }
  if(!is_content_hash(content_hash)) {
    return fail(result, ErrorKind::InvalidArgument, "not a content hash: '" + content_hash + "'", logger);
  }

  // Discovery asks the first server only.
  Catalog catalog;
  try {
    catalog = fetch_catalog(servers.front(), config.logger);
  } catch(const TransferError& e) {
    return fail(result, e.kind(), "catalog from " + servers.front() + ": " + e.what(), logger);
  }
  auto entry = find_entry(catalog, content_hash);
  if(!entry) {
    return fail(result, ErrorKind::FileNotFound,
                "file " + content_hash + " not found on " + servers.front(), logger);
  }
  const std::string output_name = file_name.empty() ? entry->name : file_name;
  if(!is_plain_file_name(output_name)) {
    return fail(result, ErrorKind::InvalidArgument, "unusable output name '" + output_name + "'", logger);
  }

  const std::size_t total_chunks = entry->chunks.size();
  result.total_chunks = total_chunks;
  log_info(logger, "File {} ({} bytes) has {} chunk(s); fetching from {} server(s)",
           output_name, entry->size, total_chunks, servers.size());

  ChunkStore store(config.chunk_dir, config.logger);
  try {
    // Chunks left by an earlier attempt must not leak into this result.
    store.remove_namespace(content_hash);
  } catch(const TransferError& e) {
    return fail(result, e.kind(), e.what(), logger);
  }

  const auto assignment = assign_round_robin(total_chunks, servers.size());
  const SwarmFetcherFactory factory = config.fetcher_factory
    ? config.fetcher_factory
    : make_peer_fetcher_factory(config.logger);
  const std::size_t worker_count = std::clamp<std::size_t>(config.workers, 1, kMaxWorkers);

  std::mutex job_mutex;
  std::deque<std::size_t> job_queue;
  for(std::size_t i = 0; i < total_chunks; ++i) job_queue.push_back(i);
  std::size_t completed_jobs = 0;
  uint64_t downloaded_bytes = 0;
  std::atomic<bool> failure{false};
  ErrorKind failure_kind = ErrorKind::ConnectionFailure;
  std::string failure_reason;

  auto take_job = [&]() -> std::optional<std::size_t> {
    std::lock_guard<std::mutex> lock(job_mutex);
    if(failure || job_queue.empty()) return std::nullopt;
    std::size_t job = job_queue.front();
    job_queue.pop_front();
    return job;
  };

  auto record_failure = [&](ErrorKind kind, const std::string& reason) {
    std::lock_guard<std::mutex> lock(job_mutex);
    if(!failure) {
      failure_kind = kind;
      failure_reason = reason;
      failure = true;
    }
    job_queue.clear();
  };

  auto worker_fn = [&](std::size_t worker_id) {
    SwarmChunkFetcher fetch_chunk;
    try {
      fetch_chunk = factory();
    } catch(const std::exception& e) {
      record_failure(ErrorKind::ConnectionFailure, e.what());
      return;
    }
    while(true) {
      auto job = take_job();
      if(!job) break;
      const std::size_t index = *job;
      const std::string& chunk_id = entry->chunks[index];
      const std::string& server = servers[assignment[index]];
      try {
        ChunkResponse chunk = fetch_chunk(server, content_hash, chunk_id);
        verify_chunk(chunk);
        store.write_chunk(content_hash, chunk_id, chunk.data);
        log_debug(logger, "worker {} stored {} ({} bytes) from {}",
                  worker_id, chunk_id, chunk.data.size(), server);

        std::size_t completed_now = 0;
        uint64_t bytes_now = 0;
        {
          std::lock_guard<std::mutex> lock(job_mutex);
          completed_now = ++completed_jobs;
          bytes_now = downloaded_bytes += chunk.data.size();
        }
        if(config.progress) {
          config.progress(completed_now, total_chunks, bytes_now);
        }
      } catch(const TransferError& e) {
        record_failure(e.kind(), chunk_id + " from " + server + ": " + e.what());
        break;
      } catch(const std::exception& e) {
        record_failure(ErrorKind::ConnectionFailure, chunk_id + " from " + server + ": " + e.what());
        break;
      }
    }
  };

  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  for(std::size_t i = 0; i < worker_count; ++i) {
    workers.emplace_back(worker_fn, i);
  }
  for(auto& thread : workers) {
    if(thread.joinable()) thread.join();
  }

  result.completed_chunks = completed_jobs;
  if(failure) {
    return fail(result, failure_kind, failure_reason, logger);
  }
  if(completed_jobs != total_chunks) {
    return fail(result, ErrorKind::ConnectionFailure,
                "only " + std::to_string(completed_jobs) + " of " +
                std::to_string(total_chunks) + " chunks arrived", logger);
  }

  Manifest manifest;
  manifest.name = output_name;
  manifest.size = entry->size;
  manifest.hash = content_hash;
  manifest.chunks = entry->chunks;
  try {
    store.write_manifest(manifest);
    result.output_path = store.reconstruct(config.output_dir, content_hash);
  } catch(const TransferError& e) {
    return fail(result, e.kind(), e.what(), logger);
  }

  std::string rebuilt_hash;
  try {
    rebuilt_hash = sha256_file_hex(result.output_path);
  } catch(const TransferError& e) {
    return fail(result, e.kind(), e.what(), logger);
  }
  if(rebuilt_hash != content_hash) {
    std::error_code ec;
    std::filesystem::remove(result.output_path, ec);
    result.output_path.clear();
    return fail(result, ErrorKind::IntegrityFailure,
                "reassembled file hashes to " + rebuilt_hash + ", expected " + content_hash, logger);
  }

  result.success = true;
  log_info(logger, "Downloaded {} to {}", output_name, result.output_path.string());
  return true;
}
