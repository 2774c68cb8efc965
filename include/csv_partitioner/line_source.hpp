#pragma once
#include "csv_partitioner/encoding.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace cp {

// Pull-based line reader over a file. Lines end at '\n', "\r\n" or a lone
// '\r'. next() yields decoded, trimmed, non-empty lines (a leading UTF-8
// byte-order mark is dropped under any decoder); next_raw() yields
// every physical line undecoded (terminator removed).
class LineSource {
public:
  struct Config {
    std::size_t chunk_bytes    = 512 * 1024;       // 512 KiB read block
    std::size_t max_line_bytes = 8 * 1024 * 1024;  // 8 MiB guard per line
  };

  explicit LineSource(std::string path);      // uses default Config{}
  LineSource(std::string path, Config cfg);   // explicit Config
  ~LineSource();

  LineSource(const LineSource&) = delete;
  LineSource& operator=(const LineSource&) = delete;

  bool open();
  bool is_open() const noexcept;

  bool next_raw(std::string& out);
  bool next(std::string& out);

  // Seek to the first byte of the input; clears the error state.
  bool reset();
  // Seek to an offset previously returned by position().
  bool seek(std::uint64_t offset);
  // Byte offset of the next unread line.
  std::uint64_t position() const noexcept;

  void set_decoder(const Decoder& d);
  const Decoder& decoder() const noexcept;

  bool failed() const noexcept;
  // The failure is a line the current decoder could not map.
  bool decode_failed() const noexcept;
  const std::string& error() const noexcept;
  int  last_error() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t line_number() const noexcept;  // physical lines consumed
  const std::string& path() const noexcept;

private:
  struct Impl; Impl* p_;
};

// Strip whitespace from both ends of UTF-8 text: ASCII whitespace, the
// separators 0x1C-0x1F, and Unicode spaces such as NEL, NBSP and U+3000.
std::string_view trim_space(std::string_view s) noexcept;

}
