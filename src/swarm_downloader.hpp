#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "errors.hpp"
#include "log.hpp"
#include "protocol.hpp"

// Fetches one chunk from the node at address. Returned data is verified by
// the caller.
using SwarmChunkFetcher = std::function<ChunkResponse(const std::string& address,
                                                      const std::string& file_hash,
                                                      const std::string& chunk_id)>;

// Called once per worker; each worker keeps what it creates (its connections)
// for its whole lifetime.
using SwarmFetcherFactory = std::function<SwarmChunkFetcher()>;

// Invoked from worker threads after each stored chunk, possibly concurrently
// and out of order.
using SwarmProgressCallback = std::function<void(std::size_t completed_chunks,
                                                 std::size_t total_chunks,
                                                 uint64_t downloaded_bytes)>;

struct SwarmConfig {
  std::size_t workers = 4;
  std::filesystem::path chunk_dir = "downloads/.chunks";
  std::filesystem::path output_dir = "downloads";
  std::shared_ptr<Logger> logger;
  SwarmProgressCallback progress;
  SwarmFetcherFactory fetcher_factory; // empty = one PeerClient per server per worker
};

struct SwarmResult {
  bool success = false;
  std::filesystem::path output_path;
  ErrorKind error = ErrorKind::ConnectionFailure;
  std::string failure_reason;
  std::size_t total_chunks = 0;
  std::size_t completed_chunks = 0;
};

// Server index for every chunk index: chunk i goes to servers[i % server_count].
std::vector<std::size_t> assign_round_robin(std::size_t chunk_count, std::size_t server_count);

SwarmFetcherFactory make_peer_fetcher_factory(std::shared_ptr<Logger> logger = nullptr);

// Looks content_hash up in the catalog of servers[0], spreads its chunks over
// servers round-robin, fetches them on config.workers threads, verifies and
// stores each one, then rebuilds <output_dir>/<file_name>. The first error of
// any worker fails the whole download; nothing is retried and no output file
// is produced on failure. An empty file_name keeps the catalog's name.
bool run_swarm_download(const std::string& content_hash,
                        const std::string& file_name,
                        const std::vector<std::string>& servers,
                        const SwarmConfig& config,
                        SwarmResult& result);
