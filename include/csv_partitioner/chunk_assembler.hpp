#pragma once
#include "csv_partitioner/output_chunk.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace cp {

// Groups data rows into fixed-size chunks. Row i (zero-based) goes to chunk
// i / capacity + 1. At most `capacity` rows are buffered at once.
class ChunkAssembler {
public:
  // Returns false to stop assembly; the chunk then counts as not emitted.
  using ChunkCallback = std::function<bool(const OutputChunk&)>;

  ChunkAssembler(std::size_t capacity, std::shared_ptr<const std::string> header);
  ~ChunkAssembler();

  ChunkAssembler(const ChunkAssembler&) = delete;
  ChunkAssembler& operator=(const ChunkAssembler&) = delete;

  bool feed(std::string row, const ChunkCallback& on_chunk);
  // Emits the trailing partial chunk, if any.
  bool finish(const ChunkCallback& on_chunk);

  std::size_t capacity() const noexcept;
  std::size_t buffered() const noexcept;
  std::uint64_t rows_seen() const noexcept;
  std::uint64_t chunks_emitted() const noexcept;
  std::uint64_t next_index() const noexcept;  // index of the chunk being filled

private:
  struct Impl; Impl* p_;
};

}
