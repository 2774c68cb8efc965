#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cp {

class LineSource;
struct SplitError;

enum class Encoding { Utf8, Latin1, Windows1252 };

// What a decoder does with bytes the encoding cannot map.
enum class InvalidBytes { Fail, Replace, Drop };

std::string_view encoding_name(Encoding e) noexcept;
std::optional<Encoding> parse_encoding(std::string_view name) noexcept;
std::optional<InvalidBytes> parse_invalid_bytes(std::string_view name) noexcept;

// Transcodes single lines to UTF-8.
class Decoder {
public:
  Decoder() = default;
  Decoder(Encoding enc, InvalidBytes on_invalid) : enc_(enc), on_invalid_(on_invalid) {}

  // Appends the UTF-8 form of `raw` to `out`. Returns false only when the
  // input holds an unmappable byte and the policy is Fail; `*bad_offset`
  // then receives the offset of that byte.
  bool decode(std::string_view raw, std::string& out,
              std::size_t* bad_offset = nullptr) const;

  Encoding encoding() const noexcept { return enc_; }
  InvalidBytes on_invalid() const noexcept { return on_invalid_; }

private:
  Encoding enc_ = Encoding::Utf8;
  InvalidBytes on_invalid_ = InvalidBytes::Fail;
};

// Decoded(text) when `text` holds a value; Failed(tried) otherwise.
struct DecodeResult {
  std::optional<std::string> text;
  Encoding encoding = Encoding::Utf8;  // meaningful only when decoded
  std::vector<Encoding> tried;

  bool decoded() const noexcept { return text.has_value(); }
};

// Strict decode attempts of `bytes` with each candidate, in order; the first
// that maps every byte wins.
DecodeResult decode_first_of(std::string_view bytes,
                             const std::vector<Encoding>& candidates);

// Length of the UTF-8 byte-order mark at the front of `s`, or 0.
std::size_t utf8_bom_length(std::string_view s) noexcept;

struct Resolution {
  Encoding encoding = Encoding::Utf8;
  InvalidBytes on_invalid = InvalidBytes::Fail;
  bool forced = false;    // configured, not probed
  bool fallback = false;  // no candidate matched the sample
  std::uint64_t sample_bytes = 0;
  std::vector<Encoding> tried;

  Decoder decoder() const { return Decoder(encoding, on_invalid); }
};

class EncodingResolver {
public:
  struct Config {
    std::vector<Encoding> candidates = {Encoding::Utf8, Encoding::Latin1,
                                        Encoding::Windows1252};
    Encoding fallback = Encoding::Utf8;
    InvalidBytes fallback_policy = InvalidBytes::Replace;
    std::optional<Encoding> forced;
    std::size_t probe_bytes = 1024 * 1024;  // 1 MiB of whole lines
  };

  EncodingResolver() = default;
  explicit EncodingResolver(Config cfg) : cfg_(std::move(cfg)) {}

  // Probes the start of `src` and restores its position before returning.
  bool resolve(LineSource& src, Resolution& out, SplitError* err = nullptr) const;

  // Moves a probed resolution past an encoding that failed beyond the
  // sample: to the next untried candidate, then to the fallback. Returns
  // false for a forced encoding or when nothing is left to try.
  bool next_candidate(Resolution& res) const;

  const Config& config() const noexcept { return cfg_; }

private:
  Config cfg_;
};

}
