#include "csv_partitioner/encoding.hpp"
#include "csv_partitioner/line_source.hpp"
#include "csv_partitioner/split_error.hpp"

#include <algorithm>
#include <string>

namespace cp {

static std::string join_names(const std::vector<Encoding>& encs) {
  std::string s;
  for (Encoding e : encs) {
    if (!s.empty()) s += ", ";
    s += encoding_name(e);
  }
  return s;
}

bool EncodingResolver::resolve(LineSource& src, Resolution& out, SplitError* err) const {
  out = Resolution{};

  if (cfg_.forced) {
    out.encoding = *cfg_.forced;
    out.on_invalid = cfg_.fallback_policy;
    out.forced = true;
    return true;
  }
  if (cfg_.candidates.empty())
    return fail(err, ErrorKind::Config, "no candidate encodings configured");

  if (!src.is_open() && !src.open())
    return fail(err, ErrorKind::Io, src.error(), 0, 0, src.last_error());

  // Sample whole raw lines so the probe never ends inside a multi-byte
  // sequence; line terminators carry no encoding information.
  const std::uint64_t start = src.position();
  std::string sample, line;
  while (sample.size() < cfg_.probe_bytes && src.next_raw(line)) {
    if (!sample.empty()) sample.push_back('\n');
    sample.append(line);
  }
  if (src.failed()) {
    std::string why = src.error();
    const int e = src.last_error();
    if (!src.seek(start)) why += "; restore failed: " + src.error();
    return fail(err, ErrorKind::Io, "encoding probe: " + why, 0, 0, e);
  }
  if (!src.seek(start))
    return fail(err, ErrorKind::Io, "encoding probe restore: " + src.error(), 0, 0,
                src.last_error());

  out.sample_bytes = sample.size();
  DecodeResult r = decode_first_of(sample, cfg_.candidates);
  out.tried = r.tried;
  if (r.decoded()) {
    out.encoding = r.encoding;
    out.on_invalid = InvalidBytes::Fail;
    return true;
  }

  if (cfg_.fallback_policy == InvalidBytes::Fail)
    return fail(err, ErrorKind::Decoding,
                "no candidate encoding decodes the input (tried " + join_names(r.tried) + ")");

  out.encoding = cfg_.fallback;
  out.on_invalid = cfg_.fallback_policy;
  out.fallback = true;
  return true;
}

bool EncodingResolver::next_candidate(Resolution& res) const {
  if (res.forced || res.fallback) return false;

  const auto& cands = cfg_.candidates;
  auto it = std::find(cands.begin(), cands.end(), res.encoding);
  if (it != cands.end()) ++it;
  for (; it != cands.end(); ++it) {
    if (std::find(res.tried.begin(), res.tried.end(), *it) != res.tried.end()) continue;
    res.encoding = *it;
    res.on_invalid = InvalidBytes::Fail;
    res.tried.push_back(*it);
    return true;
  }

  if (cfg_.fallback_policy == InvalidBytes::Fail) return false;
  res.encoding = cfg_.fallback;
  res.on_invalid = cfg_.fallback_policy;
  res.fallback = true;
  return true;
}

}
