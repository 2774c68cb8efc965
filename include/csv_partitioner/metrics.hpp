#pragma once
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cp {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct SplitStats {
  std::uint64_t rows = 0;
  std::uint64_t bytes = 0;
  std::uint64_t chunks = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double rows_per_sec = 0.0;

  std::vector<StageTiming> stages;  // in start order
};

class MetricsRegistry {
public:
  void add_rows(std::uint64_t n) noexcept { rows_ += n; }
  void add_chunk() noexcept { ++chunks_; }
  void set_bytes(std::uint64_t b) noexcept { bytes_ = b; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  SplitStats snapshot(double wall_ms) const;

private:
  std::uint64_t rows_{0};
  std::uint64_t bytes_{0};
  std::uint64_t chunks_{0};
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
