#include "csv_partitioner/chunk_sink.hpp"
#include "csv_partitioner/path_utils.hpp"

#include <filesystem>
#include <fstream>
#include <string_view>
#include <system_error>
#include <utility>

namespace cp {

static bool set_err(std::string* err, std::string msg) {
  if (err) *err = std::move(msg);
  return false;
}

DirectorySink::DirectorySink(Config cfg) : cfg_(std::move(cfg)) {}

bool DirectorySink::emit(const OutputChunk& chunk, std::string* err) {
  std::string name;
  if (!render_chunk_name(cfg_.name_template, cfg_.stem, chunk.index, name, err)) return false;

  const std::filesystem::path final_path = std::filesystem::path(cfg_.out_dir) / name;
  std::filesystem::path part_path = final_path;
  part_path += ".part";

  if (!ensure_parent_dirs(final_path))
    return set_err(err, "cannot create output directory " + final_path.parent_path().string());

  Sha256 digest;
  std::uint64_t bytes = 0;
  {
    std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
    if (!out) return set_err(err, "failed to open " + part_path.string());

    auto put = [&](std::string_view line) {
      out.write(line.data(), static_cast<std::streamsize>(line.size()));
      out.put('\n');
      digest.update(line);
      digest.update('\n');
      bytes += line.size() + 1;
    };
    put(chunk.header_line());
    for (const auto& row : chunk.rows) put(row);
    out.flush();

    if (!out) {
      out.close();
      std::error_code ec;
      std::filesystem::remove(part_path, ec);
      return set_err(err, "failed to write " + part_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(part_path, final_path, ec);
  if (ec) {
    std::string msg = "failed to move " + part_path.string() + " -> " +
                      final_path.string() + " (" + ec.message() + ")";
    std::filesystem::remove(part_path, ec);
    return set_err(err, std::move(msg));
  }

  files_.push_back(ChunkFile{chunk.index, final_path.string(), chunk.row_count(),
                             bytes, digest.hex_final()});
  return true;
}

}
