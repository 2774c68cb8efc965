#include "csv_partitioner/chunk_assembler.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace cp {

// Upper bound for the up-front reservation of a chunk buffer.
static constexpr std::size_t kReserveRows = 1u << 16;

struct ChunkAssembler::Impl {
  std::size_t capacity;
  std::shared_ptr<const std::string> header;
  std::vector<std::string> buffer;
  std::uint64_t next_index{1};
  std::uint64_t rows_seen{0};
  std::uint64_t emitted{0};
  bool stopped{false};

  void reserve() { buffer.reserve(std::min(capacity, kReserveRows)); }

  bool emit(const ChunkCallback& on_chunk) {
    OutputChunk chunk;
    chunk.index = next_index;
    chunk.header = header;
    chunk.rows = std::move(buffer);
    buffer = std::vector<std::string>();
    if (!on_chunk(chunk)) { stopped = true; return false; }
    ++next_index;
    ++emitted;
    reserve();
    return true;
  }
};

ChunkAssembler::ChunkAssembler(std::size_t capacity, std::shared_ptr<const std::string> header)
  : p_(new Impl{capacity ? capacity : 1, std::move(header)}) {
  p_->reserve();
}

ChunkAssembler::~ChunkAssembler() { delete p_; }

bool ChunkAssembler::feed(std::string row, const ChunkCallback& on_chunk) {
  if (p_->stopped) return false;
  p_->buffer.push_back(std::move(row));
  ++p_->rows_seen;
  if (p_->buffer.size() < p_->capacity) return true;
  return p_->emit(on_chunk);
}

bool ChunkAssembler::finish(const ChunkCallback& on_chunk) {
  if (p_->stopped) return false;
  if (p_->buffer.empty()) return true;
  return p_->emit(on_chunk);
}

std::size_t ChunkAssembler::capacity() const noexcept { return p_->capacity; }
std::size_t ChunkAssembler::buffered() const noexcept { return p_->buffer.size(); }
std::uint64_t ChunkAssembler::rows_seen() const noexcept { return p_->rows_seen; }
std::uint64_t ChunkAssembler::chunks_emitted() const noexcept { return p_->emitted; }
std::uint64_t ChunkAssembler::next_index() const noexcept { return p_->next_index; }

}
