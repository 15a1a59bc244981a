#include "errors.hpp"

const char* error_kind_name(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::ConnectionFailure: return "ConnectionFailure";
    case ErrorKind::MalformedMessage:  return "MalformedMessage";
    case ErrorKind::FileNotFound:      return "FileNotFound";
    case ErrorKind::IntegrityFailure:  return "IntegrityFailure";
    case ErrorKind::EncodingFailure:   return "EncodingFailure";
    case ErrorKind::StorageFailure:    return "StorageFailure";
    case ErrorKind::InvalidArgument:   return "InvalidArgument";
  }
  return "Unknown";
}
