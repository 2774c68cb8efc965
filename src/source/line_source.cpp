#include "csv_partitioner/line_source.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace cp {

// Length of the whitespace character starting at s[i], or 0. Covers ASCII
// whitespace, the information separators 0x1C-0x1F and the Unicode
// White_Space characters outside ASCII.
static std::size_t space_len_at(std::string_view s, std::size_t i) noexcept {
  const auto b = [&](std::size_t k) { return static_cast<unsigned char>(s[i + k]); };
  const std::size_t n = s.size() - i;
  const unsigned char c = b(0);
  if (c == ' ' || (c >= 0x09 && c <= 0x0D) || (c >= 0x1C && c <= 0x1F)) return 1;
  if (n >= 2 && c == 0xC2 && (b(1) == 0x85 || b(1) == 0xA0)) return 2;
  if (n < 3) return 0;
  if (c == 0xE1 && b(1) == 0x9A && b(2) == 0x80) return 3;          // U+1680
  if (c == 0xE2 && b(1) == 0x80 &&                                   // U+2000-200A, 2028, 2029, 202F
      ((b(2) >= 0x80 && b(2) <= 0x8A) || b(2) == 0xA8 || b(2) == 0xA9 || b(2) == 0xAF))
    return 3;
  if (c == 0xE2 && b(1) == 0x81 && b(2) == 0x9F) return 3;          // U+205F
  if (c == 0xE3 && b(1) == 0x80 && b(2) == 0x80) return 3;          // U+3000
  return 0;
}

std::string_view trim_space(std::string_view s) noexcept {
  while (!s.empty()) {
    const std::size_t n = space_len_at(s, 0);
    if (!n) break;
    s.remove_prefix(n);
  }
  while (!s.empty()) {
    std::size_t n = 0;
    for (std::size_t len = 1; len <= 3 && len <= s.size() && !n; ++len)
      if (space_len_at(s, s.size() - len) == len) n = len;
    if (!n) break;
    s.remove_suffix(n);
  }
  return s;
}

struct LineSource::Impl {
  std::string path;
  Config cfg;
  Decoder decoder;

  FILE* f{nullptr};
  std::vector<char> buf;
  std::size_t head{0}, tail{0};  // unread bytes are buf[head, tail)
  bool eof{false};
  bool pending_cr{false};        // last line ended in '\r' at a block edge

  std::uint64_t offset{0};       // file offset of buf[head]
  std::uint64_t line_start{0};   // offset of the line last returned by next_raw
  std::uint64_t bytes{0};
  std::uint64_t lines{0};

  bool failed{false};
  bool undecodable{false};       // failure came from the decoder
  int last_errno{0};
  std::string err;
  std::string scratch;

  ~Impl() { if (f) std::fclose(f); }

  bool set_error(int e, std::string msg) {
    failed = true;
    last_errno = e;
    err = std::move(msg);
    if (e) err += std::string(": ") + std::strerror(e);
    return false;
  }

  bool open() {
    if (f) return true;
    f = std::fopen(path.c_str(), "rb");
    if (!f) return set_error(errno, "cannot open " + path);
    buf.assign(std::max<std::size_t>(cfg.chunk_bytes, 1), 0);
    return true;
  }

  bool fill() {
    head = tail = 0;
    std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
    if (n < buf.size()) {
      if (std::ferror(f)) return set_error(errno, "read failed on " + path);
      eof = true;
    }
    tail = n;
    bytes += n;
    return true;
  }

  bool seek(std::uint64_t to) {
    if (!f && !open()) return false;
    if (fseeko(f, static_cast<off_t>(to), SEEK_SET) != 0)
      return set_error(errno, "seek failed on " + path);
    std::clearerr(f);
    head = tail = 0;
    eof = pending_cr = failed = undecodable = false;
    last_errno = 0;
    err.clear();
    offset = line_start = to;
    if (to == 0) lines = 0;
    return true;
  }

  bool next_raw(std::string& out) {
    out.clear();
    if (failed) return false;
    if (!f && !open()) return false;

    line_start = offset;
    bool have_bytes = false;
    while (true) {
      if (head == tail) {
        if (eof) break;
        if (!fill()) return false;
        continue;
      }
      if (pending_cr) {
        pending_cr = false;
        if (buf[head] == '\n') { ++head; ++offset; line_start = offset; continue; }
      }

      std::string_view block(buf.data() + head, tail - head);
      std::size_t pos = block.find_first_of("\r\n");
      std::size_t take = (pos == std::string_view::npos) ? block.size() : pos;

      if (out.size() + take > cfg.max_line_bytes)
        return set_error(0, "line " + std::to_string(lines + 1) + " of " + path +
                            " exceeds " + std::to_string(cfg.max_line_bytes) + " bytes");

      out.append(block.data(), take);
      if (pos == std::string_view::npos) {
        head = tail;
        offset += take;
        have_bytes = true;
        continue;
      }

      // We have a full line
      const char term = block[pos];
      head += pos + 1;
      offset += pos + 1;
      if (term == '\r') {
        if (head < tail) {
          if (buf[head] == '\n') { ++head; ++offset; }
        } else {
          pending_cr = true;
        }
      }
      ++lines;
      return true;
    }

    // Last line without a terminator
    if (have_bytes) { ++lines; return true; }
    return false;
  }

  bool next(std::string& out) {
    while (next_raw(scratch)) {
      std::string_view v(scratch);
      if (line_start == 0) v.remove_prefix(utf8_bom_length(v));

      out.clear();
      std::size_t bad = 0;
      if (!decoder.decode(v, out, &bad)) {
        char hex[8];
        std::snprintf(hex, sizeof(hex), "0x%02X", static_cast<unsigned char>(v[bad]));
        set_error(0, "line " + std::to_string(lines) + " of " + path + ": byte " +
                     hex + " is not valid " + std::string(encoding_name(decoder.encoding())));
        undecodable = true;
        return false;
      }

      const std::string_view t = trim_space(out);
      if (t.empty()) continue;
      const std::size_t lead = static_cast<std::size_t>(t.data() - out.data());
      out.erase(lead + t.size());
      out.erase(0, lead);
      return true;
    }
    return false;
  }
};

LineSource::LineSource(std::string path)
  : LineSource(std::move(path), Config{}) {}

LineSource::LineSource(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) {}

LineSource::~LineSource() { delete p_; }

bool LineSource::open() { return p_->open(); }
bool LineSource::is_open() const noexcept { return p_->f != nullptr; }

bool LineSource::next_raw(std::string& out) { return p_->next_raw(out); }
bool LineSource::next(std::string& out) { return p_->next(out); }

bool LineSource::reset() { return p_->seek(0); }
bool LineSource::seek(std::uint64_t offset) { return p_->seek(offset); }
std::uint64_t LineSource::position() const noexcept { return p_->offset; }

void LineSource::set_decoder(const Decoder& d) { p_->decoder = d; }
const Decoder& LineSource::decoder() const noexcept { return p_->decoder; }

bool LineSource::failed() const noexcept { return p_->failed; }
bool LineSource::decode_failed() const noexcept { return p_->failed && p_->undecodable; }
const std::string& LineSource::error() const noexcept { return p_->err; }
int  LineSource::last_error() const noexcept { return p_->last_errno; }
std::uint64_t LineSource::bytes_read() const noexcept { return p_->bytes; }
std::uint64_t LineSource::line_number() const noexcept { return p_->lines; }
const std::string& LineSource::path() const noexcept { return p_->path; }

}
