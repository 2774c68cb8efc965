#include "csv_partitioner/path_utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <sys/wait.h>
#include <simdjson.h>

#ifndef CP_PARTITIONER_BIN
#define CP_PARTITIONER_BIN "csv-partitioner"
#endif

namespace fs = std::filesystem;

static int failures = 0;

static void expect(bool cond, const std::string& what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static std::string env_or(const char* k, const char* defv) {
  const char* v = std::getenv(k);
  return (v && *v) ? std::string(v) : std::string(defv);
}

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

static fs::path fresh_dir(const std::string& name) {
  fs::path d = fs::temp_directory_path() / ("cp_e2e_" + name);
  std::error_code ec;
  fs::remove_all(d, ec);
  return d;
}

// Runs the partitioner with stdout/stderr sent to <log>; returns its exit code.
static int run_bin(const std::string& bin, const std::string& args, const fs::path& log) {
  const std::string cmd = "\"" + bin + "\" " + args + " >\"" + log.string() + "\" 2>&1";
  const int rc = std::system(cmd.c_str());
  if (rc == -1 || !WIFEXITED(rc)) return -1;
  return WEXITSTATUS(rc);
}

struct ChunkEntry {
  uint64_t index{0};
  std::string file;
  uint64_t rows{0};
  std::string sha256;
};

struct Manifest {
  bool loaded{false};
  std::string status;
  uint64_t total_rows{0};
  uint64_t rows_processed{0};
  std::string encoding;
  std::vector<ChunkEntry> chunks;
  std::string error_kind;
};

static Manifest load_manifest(const fs::path& p) {
  Manifest m;
  simdjson::dom::parser parser;
  simdjson::dom::element doc;
  if (parser.load(p.string()).get(doc)) return m;

  std::string_view sv;
  if (!doc["status"].get(sv)) m.status = std::string(sv);
  if (!doc["encoding"].get(sv)) m.encoding = std::string(sv);
  (void)doc["total_rows"].get(m.total_rows);
  (void)doc["rows_processed"].get(m.rows_processed);

  simdjson::dom::array chunks;
  if (!doc["chunks"].get(chunks)) {
    for (simdjson::dom::element c : chunks) {
      ChunkEntry e;
      (void)c["index"].get(e.index);
      (void)c["rows"].get(e.rows);
      if (!c["file"].get(sv)) e.file = std::string(sv);
      if (!c["sha256"].get(sv)) e.sha256 = std::string(sv);
      m.chunks.push_back(e);
    }
  }
  simdjson::dom::object err;
  if (!doc["error"].get(err) && !err["kind"].get(sv)) m.error_kind = std::string(sv);
  m.loaded = true;
  return m;
}

int main() {
  const std::string bin = env_or("CP_PARTITIONER_BIN", CP_PARTITIONER_BIN);
  const fs::path in = "tests/data/utf8.csv";
  if (!fs::exists(in)) { std::cerr << "[ERR] fixture not found: " << in << "\n"; return 2; }
  const fs::path log = fs::temp_directory_path() / "cp_e2e.log";

  // Split 7 rows at capacity 3 -> 3 files with the header replicated
  const fs::path out1 = fresh_dir("run1");
  int rc = run_bin(bin, "\"" + in.string() + "\" --capacity=3 --out-dir=\"" + out1.string() + "\"", log);
  expect(rc == 0, "split exit code " + std::to_string(rc) + " (see " + log.string() + ")");

  const std::string header = "id,name,city\n";
  std::string rejoined = header;
  for (int i = 1; i <= 3; ++i) {
    const fs::path f = out1 / ("split_" + std::to_string(i) + ".csv");
    expect(fs::exists(f), "missing " + f.string());
    const std::string body = slurp(f);
    expect(body.rfind(header, 0) == 0, f.filename().string() + " does not start with the header");
    rejoined += body.substr(body.find('\n') + 1);
  }
  expect(!fs::exists(out1 / "split_4.csv"), "unexpected split_4.csv");
  expect(rejoined == slurp(in), "chunks without headers do not rebuild the input");

  const std::string out_log = slurp(log);
  expect(out_log.find("Created " + (out1 / "split_1.csv").string() + " with 3 records") != std::string::npos,
         "missing 'Created ... with 3 records' line");

  Manifest m1 = load_manifest(out1 / "manifest.json");
  expect(m1.loaded, "manifest.json did not parse");
  expect(m1.status == "completed" && m1.total_rows == 7 && m1.rows_processed == 7,
         "manifest totals: status=" + m1.status);
  expect(m1.encoding == "utf-8", "manifest encoding: " + m1.encoding);
  expect(m1.chunks.size() == 3, "manifest lists " + std::to_string(m1.chunks.size()) + " chunks");
  if (m1.chunks.size() == 3) {
    const uint64_t want_rows[] = {3, 3, 1};
    for (size_t i = 0; i < 3; ++i) {
      const auto& c = m1.chunks[i];
      expect(c.index == i + 1 && c.rows == want_rows[i], "manifest chunk " + std::to_string(i + 1));
      expect(c.sha256 == cp::sha256_hex(slurp(out1 / c.file)), "digest of " + c.file);
    }
  }

  // Same input, same capacity -> byte-identical output
  const fs::path out2 = fresh_dir("run2");
  rc = run_bin(bin, "\"" + in.string() + "\" --capacity=3 --quiet --out-dir=\"" + out2.string() + "\"", log);
  Manifest m2 = load_manifest(out2 / "manifest.json");
  expect(rc == 0 && m2.chunks.size() == m1.chunks.size(), "second run");
  for (size_t i = 0; i < m1.chunks.size() && i < m2.chunks.size(); ++i)
    expect(m1.chunks[i].sha256 == m2.chunks[i].sha256, "second run differs at chunk " + std::to_string(i + 1));

  // Custom name template
  const fs::path out3 = fresh_dir("tpl");
  rc = run_bin(bin, "\"" + in.string() + "\" --capacity=5 --quiet --name-template=\"{{stem}}-{{index}}.csv\""
                    " --out-dir=\"" + out3.string() + "\"", log);
  expect(rc == 0 && fs::exists(out3 / "utf8-1.csv") && fs::exists(out3 / "utf8-2.csv"), "name template");

  // A template that ignores the index is rejected up front
  rc = run_bin(bin, "\"" + in.string() + "\" --name-template=same.csv --out-dir=\"" +
                    fresh_dir("same").string() + "\"", log);
  expect(rc == 1, "constant name template exit code " + std::to_string(rc));

  // Count only
  rc = run_bin(bin, "\"" + in.string() + "\" --capacity=3 --count-only", log);
  expect(rc == 0 && slurp(log).find("rows=7 capacity=3 files=3 encoding=utf-8") != std::string::npos,
         "count-only output: " + slurp(log));

  // Header only -> failed, nothing written
  const fs::path out4 = fresh_dir("header_only");
  rc = run_bin(bin, "tests/data/header_only.csv --out-dir=\"" + out4.string() + "\"", log);
  expect(rc == 3, "header-only exit code " + std::to_string(rc));
  expect(!fs::exists(out4 / "split_1.csv") && !fs::exists(out4 / "manifest.json"),
         "header-only wrote output");

  // Latin-1 fixture comes out as UTF-8
  const fs::path out5 = fresh_dir("latin1");
  rc = run_bin(bin, "tests/data/latin1.csv --quiet --out-dir=\"" + out5.string() + "\"", log);
  expect(rc == 0 && slurp(out5 / "split_1.csv") ==
         "id,name\n1,Jos\xc3\xa9\n2,Fran\xc3\xa7ois\n3,M\xc3\xbcller\n", "latin-1 transcoded");
  expect(load_manifest(out5 / "manifest.json").encoding == "latin-1", "latin-1 manifest encoding");

  // Usage and input errors
  expect(run_bin(bin, "", log) == 1, "no arguments exit code");
  expect(run_bin(bin, "\"" + in.string() + "\" --capacity=0", log) == 1, "capacity 0 exit code");
  expect(run_bin(bin, "\"" + in.string() + "\" --bogus", log) == 1, "unknown option exit code");
  expect(run_bin(bin, "tests/data/does_not_exist.csv", log) == 2, "missing input exit code");
  expect(run_bin(bin, "\"" + in.string() + "\" --max-input-mb=0.0000001", log) == 2, "size guard exit code");
  expect(run_bin(bin, "\"" + in.string() + "\" --max-input-mb=nan", log) == 1, "non-finite size limit exit code");
  expect(run_bin(bin, "\"" + in.string() + "\" --max-input-mb=inf", log) == 1, "infinite size limit exit code");

  if (failures) { std::cerr << "[FAIL] " << failures << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] end-to-end split: " << m1.chunks.size() << " chunks in " << out1 << "\n";
  return 0;
}
