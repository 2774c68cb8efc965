#include "csv_partitioner/chunk_sink.hpp"
#include "csv_partitioner/encoding.hpp"
#include "csv_partitioner/line_source.hpp"
#include "csv_partitioner/manifest.hpp"
#include "csv_partitioner/partition_driver.hpp"
#include "csv_partitioner/path_utils.hpp"
#include "csv_partitioner/row_counter.hpp"
#include "csv_partitioner/split_error.hpp"

#include <fast_float/fast_float.h>

#include <atomic>
#include <charconv>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

namespace {

constexpr int kExitOk        = 0;
constexpr int kExitUsage     = 1;
constexpr int kExitInput     = 2;
constexpr int kExitFailed    = 3;
constexpr int kExitCancelled = 130;

std::atomic<bool> g_cancel{false};

void on_sigint(int) { g_cancel.store(true); }

struct Cli {
  std::string input;
  std::uint64_t capacity = 49'999;
  std::string out_dir;                 // empty -> <input dir>/<stem>_split
  std::string name_template = "split_{{index}}.csv";
  std::string encoding = "auto";
  std::string on_invalid = "replace";
  std::uint64_t probe_bytes = 1024 * 1024;
  double max_input_mb = 200.0;         // 0 disables the guard
  bool single_pass = false;
  bool count_only = false;
  bool manifest = true;
  bool quiet = false;
  bool bad = false;
};

const char* kUsage =
  "Usage: csv-partitioner <input.csv> [--capacity=N|--chunk-size=N] [--out-dir=DIR]\n"
  "                       [--name-template=TPL] [--encoding=auto|utf-8|latin-1|windows-1252]\n"
  "                       [--on-invalid=replace|drop|fail] [--probe-bytes=N]\n"
  "                       [--max-input-mb=X] [--single-pass] [--count-only]\n"
  "                       [--no-manifest] [--quiet]\n"
  "Splits a CSV into files of at most N data rows (default 49999), each with the header.\n"
  "TPL is a mustache template over {{index}} and {{stem}} (default split_{{index}}.csv).\n";

bool parse_u64(const std::string& s, std::uint64_t* out) {
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), *out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

bool parse_double(const std::string& s, double* out) {
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), *out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_u = [&](const char* pfx, std::uint64_t* out){
      if (a.rfind(pfx, 0) != 0) return false;
      if (!parse_u64(a.substr(std::string(pfx).size()), out)) {
        std::cerr << "[split] bad number in " << a << "\n";
        c.bad = true;
      }
      return true;
    };
    if (eat_u("--capacity=", &c.capacity)) continue;
    if (eat_u("--chunk-size=", &c.capacity)) continue;
    if (eat_u("--probe-bytes=", &c.probe_bytes)) continue;
    if (eat("--out-dir=", &c.out_dir)) continue;
    if (eat("--name-template=", &c.name_template)) continue;
    if (eat("--encoding=", &c.encoding)) continue;
    if (eat("--on-invalid=", &c.on_invalid)) continue;
    if (eat("--input=", &c.input)) continue;
    if (a.rfind("--max-input-mb=", 0) == 0) {
      if (!parse_double(a.substr(15), &c.max_input_mb) ||
          !std::isfinite(c.max_input_mb) || c.max_input_mb < 0) {
        std::cerr << "[split] bad number in " << a << "\n";
        c.bad = true;
      }
      continue;
    }
    if (a == "--single-pass") { c.single_pass = true;  continue; }
    if (a == "--count-only")  { c.count_only  = true;  continue; }
    if (a == "--no-manifest") { c.manifest    = false; continue; }
    if (a == "--quiet")       { c.quiet       = true;  continue; }
    if (a == "-h" || a == "--help") {
      std::cout << kUsage;
      std::exit(kExitOk);
    }
    if (a.rfind("--", 0) == 0) {
      std::cerr << "[split] unknown option: " << a << "\n";
      c.bad = true;
      continue;
    }
    if (!c.input.empty()) {
      std::cerr << "[split] more than one input given: " << a << "\n";
      c.bad = true;
      continue;
    }
    c.input = a;
  }
  if (c.input.empty()) c.bad = true;
  if (c.capacity == 0) {
    std::cerr << "[split] capacity must be positive\n";
    c.bad = true;
  }
  return c;
}

bool build_driver_config(const Cli& cli, cp::PartitionDriver::Config* cfg) {
  cfg->capacity = static_cast<std::size_t>(cli.capacity);
  cfg->count_first = !cli.single_pass;
  cfg->encoding.probe_bytes = static_cast<std::size_t>(cli.probe_bytes);

  auto policy = cp::parse_invalid_bytes(cli.on_invalid);
  if (!policy) {
    std::cerr << "[split] unknown --on-invalid value: " << cli.on_invalid << "\n";
    return false;
  }
  cfg->encoding.fallback_policy = *policy;

  if (cli.encoding != "auto") {
    auto enc = cp::parse_encoding(cli.encoding);
    if (!enc) {
      std::cerr << "[split] unknown --encoding value: " << cli.encoding << "\n";
      return false;
    }
    cfg->encoding.forced = *enc;
  }
  return true;
}

// Two chunks must never share a file name.
bool check_name_template(const std::string& tpl, const std::string& stem) {
  std::string first, second, err;
  if (!cp::render_chunk_name(tpl, stem, 1, first, &err) ||
      !cp::render_chunk_name(tpl, stem, 2, second, &err)) {
    std::cerr << "[split] " << err << "\n";
    return false;
  }
  if (first == second) {
    std::cerr << "[split] name template '" << tpl << "' does not vary with {{index}}\n";
    return false;
  }
  return true;
}

int count_only(const Cli& cli, const cp::PartitionDriver::Config& cfg) {
  cp::LineSource src(cli.input);
  cp::Resolution res;
  cp::SplitError err;
  cp::EncodingResolver resolver(cfg.encoding);
  if (!resolver.resolve(src, res, &err)) {
    std::cerr << "[encoding] " << err.describe() << "\n";
    return kExitFailed;
  }

  cp::RowCount rc;
  if (!cp::count_rows(src, resolver, res, rc, &err)) {
    std::cerr << "[split] " << err.describe() << "\n";
    return kExitFailed;
  }
  if (rc.lines < 2) {
    std::cerr << "[split] empty_input: file must have a header and at least one data row\n";
    return kExitFailed;
  }
  const std::uint64_t files = (rc.data_rows + cli.capacity - 1) / cli.capacity;
  std::cout << "rows=" << rc.data_rows
            << " capacity=" << cli.capacity
            << " files=" << files
            << " encoding=" << cp::encoding_name(res.encoding) << "\n";
  return kExitOk;
}

cp::ManifestPayload make_manifest(const Cli& cli,
                                  const cp::PartitionDriver& driver,
                                  const cp::SplitReport& rep,
                                  const cp::DirectorySink& sink,
                                  const cp::SplitError* err) {
  cp::ManifestPayload p{};
  p.status = err ? "failed" : "completed";
  p.filename = cli.input;
  std::error_code fec;
  p.file_size = std::filesystem::file_size(cli.input, fec);
  if (fec) p.file_size = 0;
  p.encoding = std::string(cp::encoding_name(rep.encoding.encoding));
  p.encoding_fallback = rep.encoding.fallback;
  p.capacity = driver.config().capacity;
  // single-pass runs learn the total only on completion
  p.total_rows = (rep.total_rows || err) ? rep.total_rows : rep.rows_processed;
  p.rows_processed = rep.rows_processed;
  p.wall_time_ms = rep.stats.wall_time_ms;
  p.throughput_mb_s = rep.stats.throughput_mb_s;
  for (const auto& s : rep.stats.stages) p.stage_times.emplace_back(s.name, s.duration_ms);
  p.chunks = sink.files();
  if (err) {
    p.error_kind = std::string(cp::error_kind_name(err->kind));
    p.error_message = err->message;
    p.error_chunk_index = err->chunk_index;
    p.error_row_offset = err->row_offset;
  }
  return p;
}

int split_one_file(const Cli& cli, const cp::PartitionDriver::Config& cfg) {
  const std::filesystem::path in(cli.input);
  const std::string stem = in.stem().string();
  const std::string out_dir = cli.out_dir.empty() ? cp::default_out_dir(in).string()
                                                  : cli.out_dir;
  if (!check_name_template(cli.name_template, stem)) return kExitUsage;

  cp::LineSource src(cli.input);
  cp::DirectorySink sink(cp::DirectorySink::Config{out_dir, cli.name_template, stem});
  cp::PartitionDriver driver(cfg);
  driver.set_cancel_flag(&g_cancel);
  if (!cli.quiet) {
    driver.set_progress([](const cp::Progress& p){
      std::cerr << "[split] chunk " << p.chunks_emitted
                << " rows " << p.rows_processed;
      if (p.total_rows) std::cerr << "/" << p.total_rows;
      std::cerr << "\n";
    });
  }

  cp::SplitReport rep;
  cp::SplitError err;
  const bool ok = driver.run(src, sink, &rep, &err);

  if (!ok) {
    std::cerr << "[split] " << cp::split_state_name(driver.state()) << ": " << err.describe() << "\n";
    if (!sink.files().empty())
      std::cerr << "[split] " << sink.files().size()
                << " chunk file(s) already written remain valid but the split is incomplete\n";
  } else if (rep.encoding.fallback) {
    std::cerr << "[encoding] no candidate matched; decoded as "
              << cp::encoding_name(rep.encoding.encoding) << " with substitution\n";
  }

  // Nothing to describe when no output directory was ever touched.
  if (cli.manifest && (ok || !sink.files().empty())) {
    std::string merr;
    const std::string json = cp::ManifestWriter::to_json(
        make_manifest(cli, driver, rep, sink, ok ? nullptr : &err));
    if (!cp::write_manifest(out_dir, json, &merr)) {
      std::cerr << "[manifest] " << merr << "\n";
      if (ok) return kExitFailed;
    }
  }

  if (!ok) return err.kind == cp::ErrorKind::Cancelled ? kExitCancelled : kExitFailed;

  for (const auto& f : sink.files())
    std::cout << "Created " << f.path << " with " << f.rows << " records\n";
  std::cout << "[split] ok: " << rep.rows_processed << " rows -> " << rep.chunks_emitted
            << " file(s) in " << out_dir << "\n";
  if (!cli.quiet)
    std::cerr << "[split] " << cp::split_state_name(driver.state())
              << " in " << rep.stats.wall_time_ms << " ms, "
              << static_cast<std::uint64_t>(rep.stats.rows_per_sec) << " rows/s\n";
  return kExitOk;
}

}

int main(int argc, char** argv) {
  auto cli = parse_cli(argc, argv);
  if (cli.bad) {
    std::cerr << kUsage;
    return kExitUsage;
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(cli.input, ec)) {
    std::cerr << "[split] input file '" << cli.input << "' does not exist\n";
    return kExitInput;
  }
  if (!cp::is_csv_path(cli.input))
    std::cerr << "[split] warning: " << cli.input << " does not have a .csv extension\n";

  const std::uint64_t size = std::filesystem::file_size(cli.input, ec);
  if (ec) {
    std::cerr << "[split] cannot stat " << cli.input << ": " << ec.message() << "\n";
    return kExitInput;
  }
  const double size_mb = size / (1024.0 * 1024.0);
  if (cli.max_input_mb > 0.0 && size_mb > cli.max_input_mb) {
    std::cerr << "[split] file too large: " << size_mb << " MB (limit "
              << cli.max_input_mb << " MB)\n";
    return kExitInput;
  }

  cp::PartitionDriver::Config cfg;
  if (!build_driver_config(cli, &cfg)) return kExitUsage;

  if (cli.count_only) return count_only(cli, cfg);

  std::signal(SIGINT, on_sigint);
  return split_one_file(cli, cfg);
}
