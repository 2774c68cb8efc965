#include "csv_partitioner/path_utils.hpp"

#include <kainjow/mustache.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace cp {

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

bool is_csv_path(std::string_view path) {
  auto ext = std::filesystem::path(std::string(path)).extension().string();
  for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return ext == ".csv";
}

std::filesystem::path default_out_dir(const std::filesystem::path& input) {
  return input.parent_path() / (input.stem().string() + "_split");
}

bool render_chunk_name(std::string_view tpl, std::string_view stem,
                       std::uint64_t index, std::string& out,
                       std::string* err) {
  kainjow::mustache::mustache m{std::string(tpl)};
  if (!m.is_valid()) {
    if (err) *err = "invalid name template '" + std::string(tpl) + "': " + m.error_message();
    return false;
  }
  // File names, not HTML: substitute values verbatim.
  m.set_custom_escape([](const std::string& s) { return s; });

  kainjow::mustache::data ctx;
  ctx.set("index", std::to_string(index));
  ctx.set("stem", std::string(stem));
  out = m.render(ctx);

  if (out.empty() || out == "." || out == ".." ||
      out.find('/') != std::string::npos || out.find('\\') != std::string::npos) {
    if (err) *err = "name template '" + std::string(tpl) + "' renders '" + out +
                    "', which is not a plain file name";
    return false;
  }
  return true;
}

Sha256::Sha256() { SHA256_Init(&ctx_); }

void Sha256::update(std::string_view data) { SHA256_Update(&ctx_, data.data(), data.size()); }
void Sha256::update(char c) { SHA256_Update(&ctx_, &c, 1); }

std::string Sha256::hex_final() {
  unsigned char md[SHA256_DIGEST_LENGTH];
  SHA256_Final(md, &ctx_);
  std::ostringstream o;
  for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i)
    o << std::hex << std::setw(2) << std::setfill('0') << (int)md[i];
  return o.str();
}

std::string sha256_hex(std::string_view data) {
  Sha256 h;
  h.update(data);
  return h.hex_final();
}

}
