#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "csv_partitioner/chunk_sink.hpp"
#include "csv_partitioner/line_source.hpp"
#include "csv_partitioner/partition_driver.hpp"

namespace fs = std::filesystem;
using clk = std::chrono::steady_clock;

static std::string make_synth_csv(std::size_t rows, std::size_t cols) {
  fs::path p = fs::temp_directory_path() / "cp_bench_synth.csv";
  std::ofstream out(p, std::ios::binary);
  for (size_t c = 0; c < cols; ++c) { out << "col" << c; if (c+1<cols) out << ","; }
  out << "\n";
  for (size_t r = 0; r < rows; ++r) {
    for (size_t c = 0; c < cols; ++c) {
      out << (r%10) << "." << (c*37%1000);
      if (c+1<cols) out << ",";
    }
    out << (r % 3 == 0 ? "\r\n" : "\n");
  }
  out.flush();
  return p.string();
}

// Counts bytes a file sink would write, without touching the disk.
class CountingSink : public cp::ChunkSink {
public:
  bool emit(const cp::OutputChunk& chunk, std::string*) override {
    bytes += chunk.byte_size();
    ++chunks;
    return true;
  }
  std::uint64_t bytes{0};
  std::uint64_t chunks{0};
};

struct Args {
  std::string csv_path;        // if empty -> synth
  std::size_t rows = 500'000;  // for synth
  std::size_t cols = 8;        // for synth
  std::size_t capacity = 49'999;
  bool single_pass = false;
  int iters = 3;
};

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i=1;i<argc;++i){
    std::string s(argv[i]);
    auto eq = s.find('=');
    auto key = s.substr(0, eq);
    auto val = (eq==std::string::npos) ? "" : s.substr(eq+1);
    if (key=="--csv") a.csv_path = val;
    else if (key=="--rows") a.rows = std::stoull(val);
    else if (key=="--cols") a.cols = std::stoull(val);
    else if (key=="--capacity") a.capacity = std::stoull(val);
    else if (key=="--single-pass") a.single_pass = true;
    else if (key=="--iters") a.iters = std::stoi(val);
    else if (key=="--help" || key=="-h") {
      std::cout <<
        "Usage: cp_bench_split [--csv=path] [--rows=N] [--cols=M] [--capacity=C] [--single-pass] [--iters=K]\n"
        "If --csv is omitted, a synthetic CSV is generated.\n";
      std::exit(0);
    }
  }
  return a;
}

int main(int argc, char** argv){
  Args a = parse_args(argc, argv);

  std::string csv = a.csv_path;
  if (csv.empty() || !fs::exists(csv)) csv = make_synth_csv(a.rows, a.cols);

  std::cout << "[split] file=" << csv << " capacity=" << a.capacity
            << " passes=" << (a.single_pass ? 1 : 2) << " iters=" << a.iters << "\n";
  for (int k=1;k<=a.iters;++k) {
    cp::PartitionDriver::Config cfg;
    cfg.capacity = a.capacity;
    cfg.count_first = !a.single_pass;
    cp::PartitionDriver driver(cfg);
    cp::LineSource src(csv);
    CountingSink sink;
    cp::SplitReport rep;
    cp::SplitError err;

    auto t0 = clk::now();
    const bool ok = driver.run(src, sink, &rep, &err);
    auto t1 = clk::now();
    if (!ok) { std::cerr << "  iter " << k << ": " << err.describe() << "\n"; return 1; }

    const double sec = std::chrono::duration<double>(t1-t0).count();
    const double mib = rep.bytes_read / (1024.0*1024.0);
    std::cout << "  iter " << k
              << ": rows=" << rep.rows_processed
              << " chunks=" << sink.chunks
              << " out_bytes=" << sink.bytes
              << " time=" << sec << "s"
              << "  throughput=" << (mib/sec) << " MiB/s"
              << "  rows/s=" << (rep.rows_processed/sec) << "\n";
    for (const auto& st : rep.stats.stages)
      std::cout << "    " << st.name << "=" << st.duration_ms << "ms\n";
  }
  return 0;
}
