#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
  ConnectionFailure, // dial/accept/read/write
  MalformedMessage,  // a line that does not decode into a known message
  FileNotFound,      // name or hash absent from a catalog
  IntegrityFailure,  // SHA-256 mismatch on a chunk or reassembled file
  EncodingFailure,   // payload could not be serialized
  StorageFailure,    // chunk store I/O
  InvalidArgument    // bad address, hash or chunk id
};

const char* error_kind_name(ErrorKind kind);

class TransferError : public std::runtime_error {
public:
  TransferError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};
