#pragma once
#include "csv_partitioner/chunk_sink.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace cp {

struct ManifestPayload {
  std::string status;  // "completed" | "failed"

  // Input metadata
  std::string filename;
  std::uint64_t file_size = 0;
  std::string encoding;
  bool encoding_fallback = false;

  // Totals
  std::uint64_t capacity = 0;
  std::uint64_t total_rows = 0;
  std::uint64_t rows_processed = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;

  std::vector<std::pair<std::string, std::uint64_t>> stage_times;
  std::vector<ChunkFile> chunks;

  // Failure context, written only when status is "failed"
  std::string error_kind;
  std::string error_message;
  std::uint64_t error_chunk_index = 0;
  std::uint64_t error_row_offset = 0;
};

class ManifestWriter {
public:
  // Serialize payload to a compact JSON string.
  static std::string to_json(const ManifestPayload& p);
};

// Writes <out_dir>/manifest.json.
bool write_manifest(const std::string& out_dir,
                    const std::string& json,
                    std::string* err_out = nullptr);

}
