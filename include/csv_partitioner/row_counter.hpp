#pragma once
#include <cstdint>

namespace cp {

class EncodingResolver;
class LineSource;
struct Resolution;
struct SplitError;

struct RowCount {
  std::uint64_t lines = 0;      // non-empty lines including the header
  std::uint64_t data_rows = 0;  // lines - 1, never negative
  std::uint64_t bytes = 0;      // bytes scanned
};

// Single forward pass over `src` with its current decoder. Empty input is
// reported as zero lines, not as an error. The source is reset to the
// start afterwards, on success and on failure.
bool count_rows(LineSource& src, RowCount& out, SplitError* err = nullptr);

// As above, but when a line fails to decode under a probed encoding the
// count restarts with resolver.next_candidate(res), until the whole input
// decodes or nothing is left to try. Installs the final decoder on `src`.
bool count_rows(LineSource& src, const EncodingResolver& resolver, Resolution& res,
                RowCount& out, SplitError* err = nullptr);

}
