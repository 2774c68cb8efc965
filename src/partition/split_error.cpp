#include "csv_partitioner/split_error.hpp"

#include <sstream>
#include <utility>

namespace cp {

std::string_view error_kind_name(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::None:       return "none";
    case ErrorKind::Decoding:   return "decoding";
    case ErrorKind::EmptyInput: return "empty_input";
    case ErrorKind::Counting:   return "counting";
    case ErrorKind::Streaming:  return "streaming";
    case ErrorKind::Sink:       return "sink";
    case ErrorKind::Cancelled:  return "cancelled";
    case ErrorKind::Io:         return "io";
    case ErrorKind::Config:     return "config";
  }
  return "unknown";
}

std::string SplitError::describe() const {
  std::ostringstream o;
  o << error_kind_name(kind) << ": " << message;
  if (chunk_index) o << " (chunk " << chunk_index << ", row " << row_offset << ")";
  return o.str();
}

bool fail(SplitError* err, ErrorKind kind, std::string message,
          std::uint64_t chunk_index, std::uint64_t row_offset, int sys_errno) {
  if (err) {
    err->kind = kind;
    err->message = std::move(message);
    err->chunk_index = chunk_index;
    err->row_offset = row_offset;
    err->sys_errno = sys_errno;
  }
  return false;
}

}
