#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace cp {

enum class ErrorKind {
  None,
  Decoding,    // no candidate encoding and fallback policy is fail
  EmptyInput,  // fewer than a header plus one data row
  Counting,    // counting pass failed
  Streaming,   // I/O or decoding failure while assembling chunks
  Sink,        // ChunkSink::emit reported failure
  Cancelled,
  Io,          // input could not be opened or read while probing
  Config
};

std::string_view error_kind_name(ErrorKind k) noexcept;

// Failure context of a split. chunk_index is the chunk in progress (1-based,
// 0 when no chunk was started), row_offset the number of data rows consumed.
struct SplitError {
  ErrorKind kind = ErrorKind::None;
  std::string message;
  std::uint64_t chunk_index = 0;
  std::uint64_t row_offset = 0;
  int sys_errno = 0;

  bool ok() const noexcept { return kind == ErrorKind::None; }
  std::string describe() const;
};

// Fill *err when the caller asked for details. Always returns false so it
// can terminate a failing bool function.
bool fail(SplitError* err, ErrorKind kind, std::string message,
          std::uint64_t chunk_index = 0, std::uint64_t row_offset = 0,
          int sys_errno = 0);

}
