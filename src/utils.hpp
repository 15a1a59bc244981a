#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(std::string_view data);
std::string sha256_hex(std::string_view data);

// Streams the file through the digest; throws TransferError(StorageFailure)
// if the file cannot be read.
std::string sha256_file_hex(const std::filesystem::path& path);

std::string base64_encode(std::string_view data);
// Throws TransferError(MalformedMessage) on input that is not valid base64.
std::string base64_decode(std::string_view encoded);

bool is_content_hash(std::string_view value);

struct HostPort {
  std::string host;
  unsigned short port = 0;
};

// "host:port" -> HostPort. Throws TransferError(InvalidArgument).
HostPort parse_host_port(const std::string& address);

// Splits "a:1, b:2,,c:3" into trimmed non-empty items.
std::vector<std::string> split_list(const std::string& value, char separator = ',');
