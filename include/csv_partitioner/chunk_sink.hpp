#pragma once
#include "csv_partitioner/output_chunk.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cp {

class ChunkSink {
public:
  virtual ~ChunkSink() = default;

  // Called once per chunk, in index order, never concurrently. Return false
  // and fill *err to fail the split.
  virtual bool emit(const OutputChunk& chunk, std::string* err) = 0;
};

struct ChunkFile {
  std::uint64_t index = 0;
  std::string path;
  std::uint64_t rows = 0;
  std::uint64_t bytes = 0;
  std::string sha256;
};

// Writes each chunk to <out_dir>/<rendered name_template>. A chunk is
// written to "<name>.part" and renamed into place once complete.
class DirectorySink : public ChunkSink {
public:
  struct Config {
    std::string out_dir = ".";
    std::string name_template = "split_{{index}}.csv";
    std::string stem;  // value of {{stem}}
  };

  explicit DirectorySink(Config cfg);

  bool emit(const OutputChunk& chunk, std::string* err) override;

  const std::vector<ChunkFile>& files() const noexcept { return files_; }
  const Config& config() const noexcept { return cfg_; }

private:
  Config cfg_;
  std::vector<ChunkFile> files_;
};

}
