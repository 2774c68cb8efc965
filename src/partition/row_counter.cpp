#include "csv_partitioner/row_counter.hpp"
#include "csv_partitioner/encoding.hpp"
#include "csv_partitioner/line_source.hpp"
#include "csv_partitioner/split_error.hpp"

#include <string>

namespace cp {

// One counting pass; *undecodable tells a decoder failure from I/O.
static bool scan(LineSource& src, RowCount& out, SplitError* err, bool* undecodable) {
  out = RowCount{};
  *undecodable = false;
  if (!src.reset())
    return fail(err, ErrorKind::Counting, src.error(), 0, 0, src.last_error());

  const std::uint64_t bytes0 = src.bytes_read();
  std::string line;
  while (src.next(line)) ++out.lines;
  out.bytes = src.bytes_read() - bytes0;

  if (src.failed()) {
    *undecodable = src.decode_failed();
    std::string why = src.error();
    const int e = src.last_error();
    if (!src.reset()) why += "; rewind failed: " + src.error();
    return fail(err, ErrorKind::Counting, why, 0, out.lines ? out.lines - 1 : 0, e);
  }

  out.data_rows = out.lines ? out.lines - 1 : 0;
  if (!src.reset())
    return fail(err, ErrorKind::Counting, "rewind after counting: " + src.error(), 0, 0,
                src.last_error());
  return true;
}

bool count_rows(LineSource& src, RowCount& out, SplitError* err) {
  bool undecodable = false;
  return scan(src, out, err, &undecodable);
}

bool count_rows(LineSource& src, const EncodingResolver& resolver, Resolution& res,
                RowCount& out, SplitError* err) {
  while (true) {
    src.set_decoder(res.decoder());
    bool undecodable = false;
    if (scan(src, out, err, &undecodable)) return true;
    if (!undecodable || !resolver.next_candidate(res)) return false;
  }
}

}
