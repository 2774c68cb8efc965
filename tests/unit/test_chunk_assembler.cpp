#include "csv_partitioner/chunk_assembler.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

static int failures = 0;

static void expect(bool cond, const std::string& what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

struct Captured {
  std::uint64_t index;
  const std::string* header;
  std::vector<std::string> rows;
};

static std::vector<Captured> assemble(std::size_t capacity, std::size_t nrows,
                                      std::shared_ptr<const std::string> header) {
  std::vector<Captured> out;
  cp::ChunkAssembler asmb(capacity, header);
  auto cb = [&](const cp::OutputChunk& c){
    out.push_back(Captured{c.index, c.header.get(), c.rows});
    return true;
  };
  for (std::size_t i = 1; i <= nrows; ++i) asmb.feed("r" + std::to_string(i), cb);
  asmb.finish(cb);
  return out;
}

int main(){
  auto header = std::make_shared<const std::string>("a,b,c");

  // header a,b,c with r1..r5 at capacity 2 -> [r1 r2] [r3 r4] [r5]
  {
    auto chunks = assemble(2, 5, header);
    expect(chunks.size() == 3, "r1..r5/2: expected 3 chunks");
    if (chunks.size() == 3) {
      expect(chunks[0].rows == std::vector<std::string>{"r1", "r2"}, "chunk 1 rows");
      expect(chunks[1].rows == std::vector<std::string>{"r3", "r4"}, "chunk 2 rows");
      expect(chunks[2].rows == std::vector<std::string>{"r5"}, "chunk 3 rows");
      for (std::size_t i = 0; i < chunks.size(); ++i) {
        expect(chunks[i].index == i + 1, "indices are contiguous from 1");
        expect(chunks[i].header == header.get(), "header is shared, not copied");
      }
    }
  }

  // R == C -> one full chunk; R == C + 1 -> C and 1
  {
    auto exact = assemble(4, 4, header);
    expect(exact.size() == 1 && exact[0].rows.size() == 4, "R == C gives one chunk");
    auto plus_one = assemble(4, 5, header);
    expect(plus_one.size() == 2 && plus_one[0].rows.size() == 4 && plus_one[1].rows.size() == 1,
           "R == C + 1 gives C and 1");
    expect(assemble(3, 0, header).empty(), "no rows, no chunks");
  }

  // Row i lands in chunk i / C + 1, concatenation restores the input order
  {
    const std::size_t C = 7, R = 52;
    auto chunks = assemble(C, R, header);
    expect(chunks.size() == (R + C - 1) / C, "ceil(R / C) chunks");
    std::size_t i = 0;
    bool ordered = true;
    for (const auto& c : chunks) {
      for (const auto& r : c.rows) {
        ordered &= (r == "r" + std::to_string(i + 1)) && (c.index == i / C + 1);
        ++i;
      }
    }
    expect(ordered && i == R, "row positions and order");
    expect(chunks.back().rows.size() == R - C * (chunks.size() - 1), "last chunk size");
  }

  // A rejected chunk stops assembly and is not counted
  {
    cp::ChunkAssembler asmb(2, header);
    int calls = 0;
    auto reject_second = [&](const cp::OutputChunk& c){ ++calls; return c.index < 2; };
    bool ok = true;
    for (int i = 0; i < 6 && ok; ++i) ok = asmb.feed("x", reject_second);
    expect(!ok && calls == 2, "assembly stops at the rejected chunk");
    expect(asmb.chunks_emitted() == 1 && asmb.next_index() == 2, "rejected chunk not counted");
    expect(!asmb.feed("y", reject_second) && !asmb.finish(reject_second) && calls == 2,
           "no emissions after a rejection");
  }

  // Bounded buffer
  {
    cp::ChunkAssembler asmb(3, header);
    std::size_t max_buffered = 0;
    auto cb = [&](const cp::OutputChunk&){ return true; };
    for (int i = 0; i < 10; ++i) {
      asmb.feed("z", cb);
      if (asmb.buffered() > max_buffered) max_buffered = asmb.buffered();
    }
    expect(max_buffered < 3 && asmb.buffered() == 1 && asmb.rows_seen() == 10, "buffer bound");
  }

  if (failures) { std::cerr << "[FAIL] " << failures << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] chunk_assembler\n";
  return 0;
}
