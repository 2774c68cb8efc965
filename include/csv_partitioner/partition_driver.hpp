#pragma once
#include "csv_partitioner/encoding.hpp"
#include "csv_partitioner/metrics.hpp"
#include "csv_partitioner/output_chunk.hpp"
#include "csv_partitioner/split_error.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>

namespace cp {

class ChunkSink;
class LineSource;

enum class SplitState { Idle, EncodingResolved, Counted, Streaming, Completed, Failed };

std::string_view split_state_name(SplitState s) noexcept;

struct SplitReport {
  Resolution encoding;
  std::uint64_t total_rows = 0;      // 0 when the counting pass was skipped
  std::uint64_t rows_processed = 0;
  std::uint64_t chunks_emitted = 0;
  std::uint64_t bytes_read = 0;
  SplitStats stats;
};

// Runs one split: resolve encoding, count rows, stream chunks to a sink.
// Every run() starts a fresh job from Idle; a failed job cannot be resumed.
class PartitionDriver {
public:
  struct Config {
    std::size_t capacity = 49'999;
    EncodingResolver::Config encoding;
    bool count_first = true;  // false: single pass, total_rows unknown
  };

  using ProgressCallback = std::function<void(const Progress&)>;

  PartitionDriver();
  explicit PartitionDriver(Config cfg);
  ~PartitionDriver();

  PartitionDriver(const PartitionDriver&) = delete;
  PartitionDriver& operator=(const PartitionDriver&) = delete;

  void set_progress(ProgressCallback cb);
  // Checked before streaming and before every chunk emission.
  void set_cancel_flag(const std::atomic<bool>* flag) noexcept;

  bool run(LineSource& src, ChunkSink& sink,
           SplitReport* report = nullptr, SplitError* err = nullptr);

  SplitState state() const noexcept;
  const Config& config() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
