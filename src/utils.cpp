#include "utils.hpp"
#include "errors.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(std::string_view data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(std::string_view data){
    return hex_from_bytes(sha256_bytes(data));
}

std::string sha256_file_hex(const std::filesystem::path& path){
    std::ifstream in(path, std::ios::binary);
    if(!in){
        throw TransferError(ErrorKind::StorageFailure, "cannot open " + path.string() + " for hashing");
    }
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if(!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1){
        throw TransferError(ErrorKind::StorageFailure, "cannot initialise SHA-256 digest");
    }
    std::vector<char> buffer(64 * 1024);
    while(in){
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = in.gcount();
        if(got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(got)) != 1){
            throw TransferError(ErrorKind::StorageFailure, "SHA-256 update failed for " + path.string());
        }
    }
    if(in.bad()){
        throw TransferError(ErrorKind::StorageFailure, "read error while hashing " + path.string());
    }
    std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
    unsigned int digest_len = 0;
    if(EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1){
        throw TransferError(ErrorKind::StorageFailure, "SHA-256 finalise failed for " + path.string());
    }
    digest.resize(digest_len);
    return hex_from_bytes(digest);
}

std::string base64_encode(std::string_view data){
    if(data.empty()) return std::string();
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

std::string base64_decode(std::string_view encoded){
    if(encoded.empty()) return std::string();
    if(encoded.size() % 4 != 0){
        throw TransferError(ErrorKind::MalformedMessage, "base64 length is not a multiple of 4");
    }
    // EVP_DecodeBlock tolerates '=' anywhere, so only the last two characters
    // may be padding and padding may not be followed by data.
    const std::size_t first_pad = encoded.find('=');
    const std::size_t data_len = first_pad == std::string_view::npos ? encoded.size() : first_pad;
    if(encoded.size() - data_len > 2){
        throw TransferError(ErrorKind::MalformedMessage, "invalid base64 padding");
    }
    for(std::size_t i = 0; i < encoded.size(); ++i){
        const char c = encoded[i];
        const bool alphabet = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                              (c >= '0' && c <= '9') || c == '+' || c == '/';
        if(i < data_len ? !alphabet : c != '='){
            throw TransferError(ErrorKind::MalformedMessage, "invalid base64 data");
        }
    }
    std::string out(3 * (encoded.size() / 4), '\0');
    int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if(written < 0){
        throw TransferError(ErrorKind::MalformedMessage, "invalid base64 data");
    }
    // EVP_DecodeBlock counts the padding as zero bytes.
    std::size_t padding = 0;
    if(encoded.back() == '=') ++padding;
    if(encoded.size() > 1 && encoded[encoded.size() - 2] == '=') ++padding;
    out.resize(static_cast<std::size_t>(written) - padding);
    return out;
}

bool is_content_hash(std::string_view value){
    if(value.size() != 2 * SHA256_DIGEST_LENGTH) return false;
    return std::all_of(value.begin(), value.end(), [](char c){
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

HostPort parse_host_port(const std::string& address){
    auto pos = address.rfind(':');
    if(pos == std::string::npos || pos == 0 || pos + 1 >= address.size()){
        throw TransferError(ErrorKind::InvalidArgument, "address must be host:port (got '" + address + "')");
    }
    HostPort out;
    out.host = address.substr(0, pos);
    if(out.host.size() > 2 && out.host.front() == '[' && out.host.back() == ']'){
        out.host = out.host.substr(1, out.host.size() - 2);
    }
    const std::string port_text = address.substr(pos + 1);
    if(!std::all_of(port_text.begin(), port_text.end(), [](unsigned char c){ return std::isdigit(c); })){
        throw TransferError(ErrorKind::InvalidArgument, "invalid port in '" + address + "'");
    }
    unsigned long port = 0;
    try {
        port = std::stoul(port_text);
    } catch(const std::exception&) {
        throw TransferError(ErrorKind::InvalidArgument, "invalid port in '" + address + "'");
    }
    if(port == 0 || port > 65535){
        throw TransferError(ErrorKind::InvalidArgument, "port out of range in '" + address + "'");
    }
    out.port = static_cast<unsigned short>(port);
    return out;
}

std::vector<std::string> split_list(const std::string& value, char separator){
    std::vector<std::string> out;
    std::string item;
    std::istringstream in(value);
    while(std::getline(in, item, separator)){
        auto first = item.find_first_not_of(" \t");
        if(first == std::string::npos) continue;
        auto last = item.find_last_not_of(" \t");
        out.push_back(item.substr(first, last - first + 1));
    }
    return out;
}
