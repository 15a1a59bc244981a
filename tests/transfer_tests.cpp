#include "chunk_store.hpp"
#include "connection.hpp"
#include "errors.hpp"
#include "node.hpp"
#include "peer_client.hpp"
#include "protocol.hpp"
#include "server.hpp"
#include "settings_manager.hpp"
#include "swarm_downloader.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <asio.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using chunkmesh::test::ScratchDir;
using chunkmesh::test::TestCase;
using chunkmesh::test::TestContext;
using chunkmesh::test::random_bytes;
using chunkmesh::test::read_file;
using chunkmesh::test::throws_kind;
using chunkmesh::test::wait_for_condition;
using chunkmesh::test::write_file;

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

constexpr std::size_t kChunk = ChunkStore::kChunkSize;

// One live server on an ephemeral loopback port serving share_dir.
struct LiveServer {
  LiveServer(TestContext& ctx, const fs::path& base, const std::string& label) {
    Server::Options options;
    options.listen_ip = "127.0.0.1";
    options.listen_port = 0;
    options.io_threads = 2;
    options.share_dir = base / "share";
    options.chunk_dir = base / "chunks";
    fs::create_directories(options.share_dir);
    share_dir = options.share_dir;
    logger = std::make_shared<Logger>(label);
    ctx.logs.attach(logger, label);
    server = std::make_unique<Server>(options, logger);
    server->start_background();
    address = "127.0.0.1:" + std::to_string(server->listen_port());
  }

  ~LiveServer() {
    if(server) server->stop();
  }

  void share(const std::string& name, const std::string& data) {
    write_file(share_dir / name, data);
  }

  fs::path share_dir;
  std::shared_ptr<Logger> logger;
  std::unique_ptr<Server> server;
  std::string address;
};

struct FetchLog {
  std::mutex mutex;
  std::vector<std::pair<std::string, std::string>> calls; // (address, chunk_id)
};

SwarmFetcherFactory recording_factory(std::shared_ptr<FetchLog> log, SwarmFetcherFactory inner) {
  return [log, inner]() -> SwarmChunkFetcher {
    auto fetch = inner();
    return [log, fetch](const std::string& address, const std::string& file_hash, const std::string& chunk_id) {
      {
        std::lock_guard<std::mutex> lock(log->mutex);
        log->calls.emplace_back(address, chunk_id);
      }
      return fetch(address, file_hash, chunk_id);
    };
  };
}

SwarmConfig client_config(const fs::path& base, std::size_t workers = 4) {
  SwarmConfig config;
  config.workers = workers;
  config.output_dir = base / "downloads";
  config.chunk_dir = base / "client_chunks";
  config.logger = std::make_shared<Logger>("client");
  return config;
}

std::string read_line(asio::ip::tcp::socket& socket, asio::streambuf& buffer) {
  asio::read_until(socket, buffer, kMessageTerminator);
  std::istream is(&buffer);
  std::string line;
  std::getline(is, line, kMessageTerminator);
  return line;
}

asio::ip::tcp::socket dial(asio::io_context& io, unsigned short port) {
  asio::ip::tcp::socket socket(io);
  socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
  return socket;
}

bool test_round_robin_assignment(TestContext&) {
  bool ok = true;
  CHUNKMESH_CHECK(ok, (assign_round_robin(7, 3) == std::vector<std::size_t>{0, 1, 2, 0, 1, 2, 0}));
  CHUNKMESH_CHECK(ok, (assign_round_robin(2, 5) == std::vector<std::size_t>{0, 1}));
  CHUNKMESH_CHECK(ok, (assign_round_robin(4, 1) == std::vector<std::size_t>{0, 0, 0, 0}));
  CHUNKMESH_CHECK(ok, assign_round_robin(0, 3).empty());
  return ok;
}

bool test_download_from_single_server(TestContext& ctx) {
  ScratchDir scratch("xfer_single");
  LiveServer node(ctx, scratch / "node", "server");
  const std::string data = random_bytes(2 * kChunk + kChunk / 2, 21);
  node.share("movie.bin", data);
  const std::string hash = sha256_hex(data);

  SwarmConfig config = client_config(scratch.path());
  std::mutex progress_mutex;
  std::size_t progress_calls = 0;
  uint64_t last_bytes = 0;
  config.progress = [&](std::size_t, std::size_t, uint64_t bytes) {
    std::lock_guard<std::mutex> lock(progress_mutex);
    ++progress_calls;
    last_bytes = std::max(last_bytes, bytes);
  };
  ctx.logs.attach(config.logger, "client");

  SwarmResult result;
  bool ok = true;
  CHUNKMESH_CHECK(ok, run_swarm_download(hash, "", {node.address}, config, result));
  CHUNKMESH_CHECK(ok, result.success);
  CHUNKMESH_CHECK(ok, result.total_chunks == 3);
  CHUNKMESH_CHECK(ok, result.completed_chunks == 3);
  CHUNKMESH_CHECK(ok, progress_calls == 3);
  CHUNKMESH_CHECK(ok, last_bytes == data.size());
  CHUNKMESH_CHECK(ok, result.output_path == scratch.path() / "downloads" / "movie.bin");
  CHUNKMESH_CHECK(ok, fs::exists(result.output_path) && read_file(result.output_path) == data);
  CHUNKMESH_CHECK(ok, sha256_file_hex(result.output_path) == hash);
  return ok;
}

bool test_slow_progress_does_not_stall_workers(TestContext& ctx) {
  ScratchDir scratch("xfer_progress");
  LiveServer node(ctx, scratch / "node", "server");
  const std::string data = random_bytes(3 * kChunk + 9, 31);
  node.share("slow.bin", data);
  const std::string hash = sha256_hex(data);

  SwarmConfig config = client_config(scratch.path(), 2);
  auto log = std::make_shared<FetchLog>();
  config.fetcher_factory = recording_factory(log, make_peer_fetcher_factory(config.logger));
  auto fetched = [log]{
    std::lock_guard<std::mutex> lock(log->mutex);
    return log->calls.size();
  };
  // The first report holds its worker until the other worker has pulled and
  // fetched every remaining chunk.
  std::atomic<bool> first{true};
  std::atomic<bool> others_progressed{false};
  config.progress = [&](std::size_t, std::size_t total, uint64_t) {
    if(first.exchange(false)) {
      others_progressed = wait_for_condition([&]{ return fetched() == total; }, 10s);
    }
  };

  SwarmResult result;
  bool ok = true;
  CHUNKMESH_CHECK(ok, run_swarm_download(hash, "", {node.address}, config, result));
  CHUNKMESH_CHECK(ok, others_progressed);
  CHUNKMESH_CHECK(ok, read_file(scratch.path() / "downloads" / "slow.bin") == data);
  return ok;
}

bool test_download_spreads_over_servers(TestContext& ctx) {
  ScratchDir scratch("xfer_multi");
  const std::string data = random_bytes(6 * kChunk + 100, 33); // 7 chunks
  const std::string hash = sha256_hex(data);
  LiveServer a(ctx, scratch / "a", "server-a");
  LiveServer b(ctx, scratch / "b", "server-b");
  LiveServer c(ctx, scratch / "c", "server-c");
  for(auto* node : {&a, &b, &c}) node->share("shared.iso", data);

  auto log = std::make_shared<FetchLog>();
  SwarmConfig config = client_config(scratch.path(), 3);
  config.fetcher_factory = recording_factory(log, make_peer_fetcher_factory(config.logger));

  SwarmResult result;
  bool ok = true;
  const std::vector<std::string> servers = {a.address, b.address, c.address};
  CHUNKMESH_CHECK(ok, run_swarm_download(hash, "copy.iso", servers, config, result));
  CHUNKMESH_CHECK(ok, read_file(scratch.path() / "downloads" / "copy.iso") == data);

  std::map<std::string, std::string> served_by;
  for(const auto& call : log->calls) served_by[call.second] = call.first;
  CHUNKMESH_CHECK(ok, log->calls.size() == 7);
  const auto expected = assign_round_robin(7, 3);
  for(std::size_t i = 0; i < 7; ++i) {
    CHUNKMESH_CHECK(ok, served_by[ChunkStore::chunk_id_for_index(i)] == servers[expected[i]]);
  }
  return ok;
}

bool test_more_workers_than_chunks(TestContext& ctx) {
  ScratchDir scratch("xfer_workers");
  LiveServer node(ctx, scratch / "node", "server");
  const std::string data = random_bytes(kChunk + 1, 44);
  node.share("two.bin", data);

  auto log = std::make_shared<FetchLog>();
  SwarmConfig config = client_config(scratch.path(), 16);
  config.fetcher_factory = recording_factory(log, make_peer_fetcher_factory(config.logger));

  SwarmResult result;
  bool ok = true;
  CHUNKMESH_CHECK(ok, run_swarm_download(sha256_hex(data), "", {node.address}, config, result));
  CHUNKMESH_CHECK(ok, log->calls.size() == 2);
  std::set<std::string> ids;
  for(const auto& call : log->calls) ids.insert(call.second);
  CHUNKMESH_CHECK(ok, (ids == std::set<std::string>{"chunk_0", "chunk_1"}));
  CHUNKMESH_CHECK(ok, read_file(result.output_path) == data);
  return ok;
}

bool test_corrupted_chunk_fails_download(TestContext& ctx) {
  ScratchDir scratch("xfer_corrupt");
  LiveServer node(ctx, scratch / "node", "server");
  const std::string data = random_bytes(3 * kChunk, 55);
  node.share("victim.bin", data);

  SwarmConfig config = client_config(scratch.path(), 2);
  auto inner = make_peer_fetcher_factory(config.logger);
  config.fetcher_factory = [inner]() -> SwarmChunkFetcher {
    auto fetch = inner();
    return [fetch](const std::string& address, const std::string& file_hash, const std::string& chunk_id) {
      ChunkResponse response = fetch(address, file_hash, chunk_id);
      if(chunk_id == "chunk_1" && !response.data.empty()) {
        response.data[0] = static_cast<char>(response.data[0] ^ 0x5a);
      }
      return response;
    };
  };

  SwarmResult result;
  bool ok = true;
  CHUNKMESH_CHECK(ok, !run_swarm_download(sha256_hex(data), "", {node.address}, config, result));
  CHUNKMESH_CHECK(ok, !result.success);
  CHUNKMESH_CHECK(ok, result.error == ErrorKind::IntegrityFailure);
  CHUNKMESH_CHECK(ok, result.failure_reason.find("chunk_1") != std::string::npos);
  CHUNKMESH_CHECK(ok, !fs::exists(scratch.path() / "downloads" / "victim.bin"));
  CHUNKMESH_CHECK(ok, result.output_path.empty());
  return ok;
}

bool test_verify_chunk(TestContext&) {
  ChunkResponse good = make_chunk_response(sha256_hex("x"), "chunk_0", "payload");
  ChunkResponse bad = good;
  bad.data = "payloaD";
  bool ok = true;
  CHUNKMESH_CHECK(ok, !throws_kind([&]{ verify_chunk(good); }, ErrorKind::IntegrityFailure));
  CHUNKMESH_CHECK(ok, throws_kind([&]{ verify_chunk(bad); }, ErrorKind::IntegrityFailure));
  return ok;
}

bool test_unknown_hash_is_file_not_found(TestContext& ctx) {
  ScratchDir scratch("xfer_missing");
  LiveServer node(ctx, scratch / "node", "server");
  node.share("present.txt", "here");

  SwarmResult result;
  bool ok = true;
  CHUNKMESH_CHECK(ok, !run_swarm_download(sha256_hex("absent"), "", {node.address},
                                          client_config(scratch.path()), result));
  CHUNKMESH_CHECK(ok, result.error == ErrorKind::FileNotFound);
  CHUNKMESH_CHECK(ok, !fs::exists(scratch.path() / "downloads" / "present.txt"));
  return ok;
}

bool test_bad_arguments(TestContext&) {
  ScratchDir scratch("xfer_args");
  SwarmResult result;
  bool ok = true;
  CHUNKMESH_CHECK(ok, !run_swarm_download(sha256_hex("a"), "", {}, client_config(scratch.path()), result));
  CHUNKMESH_CHECK(ok, result.error == ErrorKind::InvalidArgument);
  CHUNKMESH_CHECK(ok, !run_swarm_download("xyz", "", {"127.0.0.1:1"}, client_config(scratch.path()), result));
  CHUNKMESH_CHECK(ok, result.error == ErrorKind::InvalidArgument);
  CHUNKMESH_CHECK(ok, !run_swarm_download(sha256_hex("a"), "", {"no-port"}, client_config(scratch.path()), result));
  CHUNKMESH_CHECK(ok, result.error == ErrorKind::InvalidArgument);
  return ok;
}

bool test_unreachable_server(TestContext& ctx) {
  ScratchDir scratch("xfer_refused");
  std::string address;
  {
    LiveServer node(ctx, scratch / "node", "server");
    address = node.address;
  }
  SwarmResult result;
  bool ok = true;
  CHUNKMESH_CHECK(ok, !run_swarm_download(sha256_hex("a"), "", {address}, client_config(scratch.path()), result));
  CHUNKMESH_CHECK(ok, result.error == ErrorKind::ConnectionFailure);
  return ok;
}

bool test_output_name_must_be_plain(TestContext& ctx) {
  ScratchDir scratch("xfer_name");
  LiveServer node(ctx, scratch / "node", "server");
  node.share("ok.txt", "fine");
  SwarmResult result;
  bool ok = true;
  CHUNKMESH_CHECK(ok, !run_swarm_download(sha256_hex("fine"), "../escape.txt", {node.address},
                                          client_config(scratch.path()), result));
  CHUNKMESH_CHECK(ok, result.error == ErrorKind::InvalidArgument);
  CHUNKMESH_CHECK(ok, !fs::exists(scratch.path() / "escape.txt"));
  return ok;
}

bool test_empty_file_download(TestContext& ctx) {
  ScratchDir scratch("xfer_empty");
  LiveServer node(ctx, scratch / "node", "server");
  node.share("empty.dat", "");

  SwarmResult result;
  bool ok = true;
  CHUNKMESH_CHECK(ok, run_swarm_download(sha256_hex(""), "", {node.address}, client_config(scratch.path()), result));
  CHUNKMESH_CHECK(ok, result.total_chunks == 0);
  CHUNKMESH_CHECK(ok, fs::exists(result.output_path) && fs::file_size(result.output_path) == 0);
  return ok;
}

bool test_stale_client_chunks_are_discarded(TestContext& ctx) {
  ScratchDir scratch("xfer_stale");
  LiveServer node(ctx, scratch / "node", "server");
  const std::string data = random_bytes(kChunk + 7, 66);
  const std::string hash = sha256_hex(data);
  node.share("fresh.bin", data);

  SwarmConfig config = client_config(scratch.path());
  ChunkStore leftovers(config.chunk_dir);
  leftovers.write_chunk(hash, "chunk_0", "garbage from an earlier attempt");
  leftovers.write_chunk(hash, "chunk_9", "unrelated");

  SwarmResult result;
  bool ok = true;
  CHUNKMESH_CHECK(ok, run_swarm_download(hash, "", {node.address}, config, result));
  CHUNKMESH_CHECK(ok, read_file(result.output_path) == data);
  CHUNKMESH_CHECK(ok, !fs::exists(leftovers.namespace_dir(hash) / "chunk_9"));
  return ok;
}

bool test_concurrent_clients(TestContext& ctx) {
  ScratchDir scratch("xfer_concurrent");
  LiveServer node(ctx, scratch / "node", "server");
  const std::string data = random_bytes(3 * kChunk + 1, 77);
  const std::string hash = sha256_hex(data);
  node.share("popular.bin", data);
  node.share("other.bin", random_bytes(kChunk / 3, 78));

  constexpr int kClients = 4;
  std::vector<int> outcomes(kClients, 0);
  std::vector<std::thread> clients;
  for(int i = 0; i < kClients; ++i) {
    clients.emplace_back([&, i]{
      SwarmConfig config = client_config(scratch.path() / ("client" + std::to_string(i)), 3);
      SwarmResult result;
      outcomes[i] = run_swarm_download(hash, "", {node.address}, config, result) &&
                    read_file(result.output_path) == data ? 1 : 0;
    });
  }
  for(auto& t : clients) t.join();

  bool ok = true;
  for(int i = 0; i < kClients; ++i) {
    CHUNKMESH_CHECK(ok, outcomes[i] == 1);
  }
  return ok;
}

bool test_malformed_line_does_not_end_session(TestContext& ctx) {
  ScratchDir scratch("xfer_malformed");
  LiveServer node(ctx, scratch / "node", "server");
  node.share("a.txt", "alpha");

  asio::io_context io;
  auto socket = dial(io, node.server->listen_port());
  const std::string traffic = std::string("this is not json\n") +
                              "{\"type\":\"Teleport\",\"payload\":{}}\n" +
                              frame_message(CatalogRequest{});
  asio::write(socket, asio::buffer(traffic));

  asio::streambuf buffer;
  Message reply = decode_message(read_line(socket, buffer));
  bool ok = true;
  CHUNKMESH_CHECK(ok, message_type(reply) == MessageType::CatalogResponse);
  if(message_type(reply) == MessageType::CatalogResponse) {
    const auto& files = std::get<CatalogResponse>(reply).catalog.files;
    CHUNKMESH_CHECK(ok, files.size() == 1 && files[0].name == "a.txt");
  }
  CHUNKMESH_CHECK(ok, ctx.logs.wait_for_substring("Skipping malformed message", 2s));
  return ok;
}

bool test_oversized_line_does_not_end_session(TestContext& ctx) {
  ScratchDir scratch("xfer_oversized");
  LiveServer node(ctx, scratch / "node", "server");
  node.share("b.txt", "bravo");

  asio::io_context io;
  auto socket = dial(io, node.server->listen_port());
  const std::string traffic = std::string(2 * Connection::kMaxRequestBytes, 'x') + "\n" +
                              frame_message(CatalogRequest{});
  asio::write(socket, asio::buffer(traffic));

  asio::streambuf buffer;
  Message reply = decode_message(read_line(socket, buffer));
  bool ok = true;
  CHUNKMESH_CHECK(ok, message_type(reply) == MessageType::CatalogResponse);
  if(message_type(reply) == MessageType::CatalogResponse) {
    const auto& files = std::get<CatalogResponse>(reply).catalog.files;
    CHUNKMESH_CHECK(ok, files.size() == 1 && files[0].name == "b.txt");
  }
  CHUNKMESH_CHECK(ok, ctx.logs.wait_for_substring("line exceeds", 2s));
  CHUNKMESH_CHECK(ok, node.server->open_connections() == 1);
  return ok;
}

bool test_requests_on_one_connection_are_answered_in_order(TestContext& ctx) {
  ScratchDir scratch("xfer_order");
  LiveServer node(ctx, scratch / "node", "server");
  const std::string data = random_bytes(2 * kChunk + 5, 88);
  node.share("ordered.bin", data);
  const std::string hash = sha256_hex(data);

  asio::io_context io;
  auto socket = dial(io, node.server->listen_port());
  const std::string traffic = frame_message(ChunkRequest{hash, "chunk_2"}) +
                              frame_message(FileMetadataRequest{"ordered.bin"}) +
                              frame_message(ChunkRequest{hash, "chunk_0"});
  asio::write(socket, asio::buffer(traffic));

  asio::streambuf buffer;
  Message first = decode_message(read_line(socket, buffer));
  Message second = decode_message(read_line(socket, buffer));
  Message third = decode_message(read_line(socket, buffer));

  bool ok = true;
  CHUNKMESH_CHECK(ok, message_type(first) == MessageType::ChunkResponse);
  CHUNKMESH_CHECK(ok, message_type(second) == MessageType::FileMetadataResponse);
  CHUNKMESH_CHECK(ok, message_type(third) == MessageType::ChunkResponse);
  if(ok) {
    CHUNKMESH_CHECK(ok, std::get<ChunkResponse>(first).chunk_id == "chunk_2");
    CHUNKMESH_CHECK(ok, std::get<ChunkResponse>(first).data == data.substr(2 * kChunk));
    CHUNKMESH_CHECK(ok, std::get<FileMetadataResponse>(second).chunks.size() == 3);
    CHUNKMESH_CHECK(ok, std::get<ChunkResponse>(third).data == data.substr(0, kChunk));
  }
  return ok;
}

bool test_disconnect_mid_request_is_isolated(TestContext& ctx) {
  ScratchDir scratch("xfer_disconnect");
  LiveServer node(ctx, scratch / "node", "server");
  node.share("steady.txt", "steady");

  PeerClient survivor(std::make_shared<Logger>("survivor"));
  survivor.connect(node.address);

  bool ok = true;
  {
    asio::io_context io;
    auto quitter = dial(io, node.server->listen_port());
    CHUNKMESH_CHECK(ok, wait_for_condition([&]{ return node.server->open_connections() == 2; }, 2s));
    const std::string partial = "{\"type\":\"Catal";
    asio::write(quitter, asio::buffer(partial));
    std::error_code ec;
    quitter.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    quitter.close(ec);
  }
  CHUNKMESH_CHECK(ok, wait_for_condition([&]{ return node.server->open_connections() == 1; }, 2s));
  CHUNKMESH_CHECK(ok, ctx.logs.wait_for_substring("Peer disconnected", 2s));

  Catalog catalog = survivor.fetch_catalog();
  CHUNKMESH_CHECK(ok, catalog.files.size() == 1);
  survivor.close();
  CHUNKMESH_CHECK(ok, wait_for_condition([&]{ return node.server->open_connections() == 0; }, 2s));
  return ok;
}

bool test_peer_client_metadata(TestContext& ctx) {
  ScratchDir scratch("xfer_metadata");
  LiveServer node(ctx, scratch / "node", "server");
  const std::string data = random_bytes(kChunk * 2, 99);
  node.share("meta.bin", data);

  PeerClient client;
  client.connect(node.address);
  bool ok = true;
  auto found = client.fetch_file_metadata("meta.bin");
  CHUNKMESH_CHECK(ok, found.hash == sha256_hex(data));
  CHUNKMESH_CHECK(ok, (found.chunks == std::vector<std::string>{"chunk_0", "chunk_1"}));
  auto missing = client.fetch_file_metadata("nothing.bin");
  CHUNKMESH_CHECK(ok, missing.chunks.empty());

  ChunkResponse chunk = client.fetch_chunk(found.hash, "chunk_1");
  CHUNKMESH_CHECK(ok, chunk.data == data.substr(kChunk));
  return ok;
}

bool test_chunk_reply_for_another_file_is_rejected(TestContext&) {
  const std::string wanted = sha256_hex("wanted");
  const std::string other = sha256_hex("other");

  // A scripted responder: each request gets the next canned reply.
  asio::io_context io;
  asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  const unsigned short port = acceptor.local_endpoint().port();
  std::thread responder([&]{
    asio::ip::tcp::socket socket(io);
    acceptor.accept(socket);
    asio::streambuf buffer;
    const std::vector<Message> replies = {
      make_chunk_response(other, "chunk_0", "bytes"),
      make_chunk_response("", "chunk_0", "bytes"),
      make_chunk_response(wanted, "chunk_0", "bytes"),
    };
    for(const auto& reply : replies) {
      std::error_code ec;
      asio::read_until(socket, buffer, kMessageTerminator, ec);
      if(ec) return;
      buffer.consume(buffer.size());
      asio::write(socket, asio::buffer(frame_message(reply)), ec);
      if(ec) return;
    }
  });

  bool ok = true;
  try {
    PeerClient client;
    client.connect("127.0.0.1:" + std::to_string(port));
    CHUNKMESH_CHECK(ok, throws_kind([&]{ client.request_chunk(wanted, "chunk_0"); }, ErrorKind::MalformedMessage));
    CHUNKMESH_CHECK(ok, client.fetch_chunk(wanted, "chunk_0").data == "bytes");
    CHUNKMESH_CHECK(ok, client.fetch_chunk(wanted, "chunk_0").file_hash == wanted);
  } catch(const TransferError& e) {
    std::cout << "\n    " << e.what();
    ok = false;
  }
  responder.join();
  return ok;
}

bool test_node_actions(TestContext& ctx) {
  ScratchDir scratch("xfer_node");
  LiveServer server(ctx, scratch / "node", "server");
  const std::string data = random_bytes(kChunk + 3, 111);
  server.share("via-node.bin", data);

  auto settings = std::make_shared<SettingsManager>();
  std::string error;
  settings->set_from_string("download_dir", (scratch.path() / "node_downloads").string(), error);
  settings->set_from_string("workers", "2", error);
  auto logger = std::make_shared<Logger>("node");
  ctx.logs.attach(logger, "node");
  Node node(settings, logger);

  bool ok = true;
  CHUNKMESH_CHECK(ok, node.list_catalog(server.address) == 0);
  CHUNKMESH_CHECK(ok, ctx.logs.contains("via-node.bin"));
  CHUNKMESH_CHECK(ok, node.file_metadata(server.address, "via-node.bin") == 0);
  CHUNKMESH_CHECK(ok, node.file_metadata(server.address, "absent.bin") == 1);
  CHUNKMESH_CHECK(ok, node.download(sha256_hex(data), "", {server.address}) == 0);
  CHUNKMESH_CHECK(ok, read_file(scratch.path() / "node_downloads" / "via-node.bin") == data);
  CHUNKMESH_CHECK(ok, node.download(sha256_hex("nope"), "", {server.address}) == 1);
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"round_robin_assignment", test_round_robin_assignment},
    {"download_from_single_server", test_download_from_single_server},
    {"slow_progress_does_not_stall_workers", test_slow_progress_does_not_stall_workers},
    {"download_spreads_over_servers", test_download_spreads_over_servers},
    {"more_workers_than_chunks", test_more_workers_than_chunks},
    {"corrupted_chunk_fails_download", test_corrupted_chunk_fails_download},
    {"verify_chunk", test_verify_chunk},
    {"unknown_hash_is_file_not_found", test_unknown_hash_is_file_not_found},
    {"bad_arguments", test_bad_arguments},
    {"unreachable_server", test_unreachable_server},
    {"output_name_must_be_plain", test_output_name_must_be_plain},
    {"empty_file_download", test_empty_file_download},
    {"stale_client_chunks_are_discarded", test_stale_client_chunks_are_discarded},
    {"concurrent_clients", test_concurrent_clients},
    {"malformed_line_does_not_end_session", test_malformed_line_does_not_end_session},
    {"oversized_line_does_not_end_session", test_oversized_line_does_not_end_session},
    {"requests_on_one_connection_are_answered_in_order", test_requests_on_one_connection_are_answered_in_order},
    {"disconnect_mid_request_is_isolated", test_disconnect_mid_request_is_isolated},
    {"peer_client_metadata", test_peer_client_metadata},
    {"chunk_reply_for_another_file_is_rejected", test_chunk_reply_for_another_file_is_rejected},
    {"node_actions", test_node_actions},
  };
  return chunkmesh::test::run_test_cases("transfer", tests, argc, argv);
}
