#include "csv_partitioner/encoding.hpp"

#include <simdjson.h>

#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>

namespace cp {

namespace {

constexpr char32_t kReplacement = 0xFFFD;

// Windows-1252 code points for 0x80..0x9F; 0 marks an undefined byte.
constexpr char32_t kCp1252High[32] = {
  0x20AC, 0,      0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
  0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0,      0x017D, 0,
  0,      0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
  0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0,      0x017E, 0x0178,
};

void append_utf8(char32_t cp, std::string& out) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// Length of the well-formed UTF-8 sequence starting at s[0], or 0 when the
// bytes are not valid there (overlongs, surrogates and > U+10FFFF rejected).
std::size_t utf8_sequence_length(const unsigned char* s, std::size_t n) {
  const unsigned char c = s[0];
  if (c < 0x80) return 1;
  std::size_t len = 0;
  unsigned char lo = 0x80, hi = 0xBF;
  if (c >= 0xC2 && c <= 0xDF)      { len = 2; }
  else if (c == 0xE0)              { len = 3; lo = 0xA0; }
  else if (c >= 0xE1 && c <= 0xEC) { len = 3; }
  else if (c == 0xED)              { len = 3; hi = 0x9F; }
  else if (c >= 0xEE && c <= 0xEF) { len = 3; }
  else if (c == 0xF0)              { len = 4; lo = 0x90; }
  else if (c >= 0xF1 && c <= 0xF3) { len = 4; }
  else if (c == 0xF4)              { len = 4; hi = 0x8F; }
  else return 0;
  if (n < len) return 0;
  if (s[1] < lo || s[1] > hi) return 0;
  for (std::size_t i = 2; i < len; ++i)
    if ((s[i] & 0xC0) != 0x80) return 0;
  return len;
}

bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i)
    if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

}

std::string_view encoding_name(Encoding e) noexcept {
  switch (e) {
    case Encoding::Utf8:        return "utf-8";
    case Encoding::Latin1:      return "latin-1";
    case Encoding::Windows1252: return "windows-1252";
  }
  return "unknown";
}

std::optional<Encoding> parse_encoding(std::string_view name) noexcept {
  if (ieq(name, "utf-8") || ieq(name, "utf8")) return Encoding::Utf8;
  if (ieq(name, "latin-1") || ieq(name, "latin1") || ieq(name, "iso-8859-1"))
    return Encoding::Latin1;
  if (ieq(name, "windows-1252") || ieq(name, "cp1252")) return Encoding::Windows1252;
  return std::nullopt;
}

std::optional<InvalidBytes> parse_invalid_bytes(std::string_view name) noexcept {
  if (ieq(name, "fail"))    return InvalidBytes::Fail;
  if (ieq(name, "replace")) return InvalidBytes::Replace;
  if (ieq(name, "drop"))    return InvalidBytes::Drop;
  return std::nullopt;
}

std::size_t utf8_bom_length(std::string_view s) noexcept {
  return (s.size() >= 3 && (unsigned char)s[0] == 0xEF &&
          (unsigned char)s[1] == 0xBB && (unsigned char)s[2] == 0xBF) ? 3 : 0;
}

bool Decoder::decode(std::string_view raw, std::string& out,
                     std::size_t* bad_offset) const {
  const auto* s = reinterpret_cast<const unsigned char*>(raw.data());
  const std::size_t n = raw.size();

  // Unmappable byte at i: apply policy. Returns false to abort.
  auto on_bad = [&](std::size_t i) {
    switch (on_invalid_) {
      case InvalidBytes::Fail:
        if (bad_offset) *bad_offset = i;
        return false;
      case InvalidBytes::Replace: append_utf8(kReplacement, out); break;
      case InvalidBytes::Drop:    break;
    }
    return true;
  };

  switch (enc_) {
    case Encoding::Utf8: {
      if (simdjson::validate_utf8(raw.data(), n)) { out.append(raw); return true; }
      out.reserve(out.size() + n);
      for (std::size_t i = 0; i < n;) {
        const std::size_t len = utf8_sequence_length(s + i, n - i);
        if (len == 0) {
          if (!on_bad(i)) return false;
          ++i;
          continue;
        }
        out.append(raw.data() + i, len);
        i += len;
      }
      return true;
    }
    case Encoding::Latin1:
      out.reserve(out.size() + n);
      for (std::size_t i = 0; i < n; ++i) append_utf8(s[i], out);
      return true;
    case Encoding::Windows1252:
      out.reserve(out.size() + n);
      for (std::size_t i = 0; i < n; ++i) {
        const unsigned char c = s[i];
        if (c < 0x80 || c >= 0xA0) { append_utf8(c, out); continue; }
        const char32_t cp = kCp1252High[c - 0x80];
        if (cp == 0) {
          if (!on_bad(i)) return false;
          continue;
        }
        append_utf8(cp, out);
      }
      return true;
  }
  return false;
}

DecodeResult decode_first_of(std::string_view bytes,
                             const std::vector<Encoding>& candidates) {
  DecodeResult r;
  for (Encoding e : candidates) {
    r.tried.push_back(e);
    std::string text;
    if (Decoder(e, InvalidBytes::Fail).decode(bytes, text)) {
      r.text = std::move(text);
      r.encoding = e;
      return r;
    }
  }
  return r;
}

}
