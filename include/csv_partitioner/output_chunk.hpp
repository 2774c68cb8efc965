#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace cp {

// One bounded unit of output: the shared header plus up to `capacity` rows.
struct OutputChunk {
  std::uint64_t index = 0;                     // 1-based
  std::shared_ptr<const std::string> header;   // shared across all chunks
  std::vector<std::string> rows;

  std::size_t row_count() const noexcept { return rows.size(); }

  std::string_view header_line() const noexcept {
    return header ? std::string_view(*header) : std::string_view{};
  }

  // Serialized byte size: header and every row, each with a '\n'.
  std::uint64_t byte_size() const noexcept {
    std::uint64_t n = header ? header->size() + 1 : 0;
    for (const auto& r : rows) n += r.size() + 1;
    return n;
  }
};

struct Progress {
  std::uint64_t rows_processed = 0;
  std::uint64_t total_rows = 0;  // 0 in single-pass mode
  std::uint64_t chunks_emitted = 0;
};

}
