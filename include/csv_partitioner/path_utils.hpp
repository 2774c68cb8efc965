#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include <openssl/sha.h>

namespace cp {

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// True for a ".csv" extension, any case.
bool is_csv_path(std::string_view path);

// Default output directory for an input: "<dir>/<stem>_split".
std::filesystem::path default_out_dir(const std::filesystem::path& input);

// Render a chunk file name from a mustache template. Known keys are
// {{index}} and {{stem}}; values are substituted unescaped. Returns false
// and fills *err for an invalid template or a name that would leave the
// output directory.
bool render_chunk_name(std::string_view tpl, std::string_view stem,
                       std::uint64_t index, std::string& out,
                       std::string* err = nullptr);

// Incremental SHA-256 with lowercase hex output.
class Sha256 {
public:
  Sha256();
  void update(std::string_view data);
  void update(char c);
  std::string hex_final();

private:
  SHA256_CTX ctx_;
};

std::string sha256_hex(std::string_view data);

}
