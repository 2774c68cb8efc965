#include "csv_partitioner/manifest.hpp"
#include "csv_partitioner/path_utils.hpp"

#include <cmath> // std::isfinite
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace cp {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char u[8];
          std::snprintf(u, sizeof(u), "\\u%04x", static_cast<unsigned char>(c));
          o << u;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string ManifestWriter::to_json(const ManifestPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"status\":";   esc(o, p.status);   o << ",";
  o << "\"filename\":"; esc(o, p.filename); o << ",";
  o << "\"file_size\":" << p.file_size << ",";
  o << "\"encoding\":"; esc(o, p.encoding); o << ",";
  o << "\"encoding_fallback\":" << (p.encoding_fallback ? "true" : "false") << ",";
  o << "\"capacity\":" << p.capacity << ",";
  o << "\"total_rows\":" << p.total_rows << ",";
  o << "\"rows_processed\":" << p.rows_processed << ",";
  o << "\"wall_time_ms\":" << safe_num(p.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(p.throughput_mb_s) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<p.stage_times.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, p.stage_times[i].first);
    o << ",\"duration_ms\":" << p.stage_times[i].second << "}";
  }
  o << "],";

  o << "\"chunks\":[";
  for (size_t i=0;i<p.chunks.size();++i){
    if (i) o << ",";
    const auto& c = p.chunks[i];
    const std::string file = std::filesystem::path(c.path).filename().string();
    o << "{\"index\":" << c.index << ",\"file\":"; esc(o, file);
    o << ",\"rows\":" << c.rows
      << ",\"bytes\":" << c.bytes
      << ",\"sha256\":"; esc(o, c.sha256);
    o << "}";
  }
  o << "]";

  if (p.status == "failed") {
    o << ",\"error\":{\"kind\":"; esc(o, p.error_kind);
    o << ",\"message\":"; esc(o, p.error_message);
    o << ",\"chunk_index\":" << p.error_chunk_index
      << ",\"row_offset\":" << p.error_row_offset << "}";
  }

  o << "}";
  return o.str();
}

bool write_manifest(const std::string& out_dir,
                    const std::string& json,
                    std::string* err_out) {
  const std::filesystem::path path = std::filesystem::path(out_dir) / "manifest.json";
  if (!ensure_parent_dirs(path)) {
    if (err_out) *err_out = "cannot create " + out_dir;
    return false;
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    if (err_out) *err_out = "failed to open " + path.string();
    return false;
  }
  out.write(json.data(), static_cast<std::streamsize>(json.size()));
  out.flush();
  if (!out) {
    if (err_out) *err_out = "failed to write " + path.string();
    return false;
  }
  return true;
}

}
