#include "csv_partitioner/partition_driver.hpp"
#include "csv_partitioner/chunk_assembler.hpp"
#include "csv_partitioner/chunk_sink.hpp"
#include "csv_partitioner/line_source.hpp"
#include "csv_partitioner/row_counter.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <utility>

namespace cp {

std::string_view split_state_name(SplitState s) noexcept {
  switch (s) {
    case SplitState::Idle:             return "idle";
    case SplitState::EncodingResolved: return "encoding_resolved";
    case SplitState::Counted:          return "counted";
    case SplitState::Streaming:        return "streaming";
    case SplitState::Completed:        return "completed";
    case SplitState::Failed:           return "failed";
  }
  return "unknown";
}

struct PartitionDriver::Impl {
  Config cfg;
  ProgressCallback progress;
  const std::atomic<bool>* cancel{nullptr};
  SplitState state{SplitState::Idle};

  bool cancelled() const {
    return cancel && cancel->load(std::memory_order_relaxed);
  }

  bool run(LineSource& src, ChunkSink& sink, SplitReport& rep, SplitError* err) {
    namespace ch = std::chrono;
    const auto t0 = ch::steady_clock::now();
    MetricsRegistry metrics;
    rep = SplitReport{};
    state = SplitState::Idle;

    auto done = [&](bool ok) {
      state = ok ? SplitState::Completed : SplitState::Failed;
      rep.stats = metrics.snapshot(
          ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count());
      return ok;
    };

    if (cfg.capacity == 0)
      return done(fail(err, ErrorKind::Config, "capacity must be positive"));
    if (!src.is_open() && !src.open())
      return done(fail(err, ErrorKind::Io, src.error(), 0, 0, src.last_error()));
    if (cancelled())
      return done(fail(err, ErrorKind::Cancelled, "cancelled before start"));

    // --- Idle -> EncodingResolved
    metrics.start_stage("resolve_encoding");
    EncodingResolver resolver(cfg.encoding);
    const bool resolved = resolver.resolve(src, rep.encoding, err);
    metrics.end_stage("resolve_encoding");
    if (!resolved) return done(false);
    src.set_decoder(rep.encoding.decoder());
    state = SplitState::EncodingResolved;

    // --- EncodingResolved -> Counted
    if (cfg.count_first) {
      metrics.start_stage("count_rows");
      RowCount rc;
      const bool counted = count_rows(src, resolver, rep.encoding, rc, err);
      metrics.end_stage("count_rows");
      if (!counted) return done(false);
      if (rc.lines < 2)
        return done(fail(err, ErrorKind::EmptyInput,
                         "input has " + std::to_string(rc.lines) +
                         " non-empty line(s); need a header and at least one data row"));
      rep.total_rows = rc.data_rows;
      state = SplitState::Counted;
    } else if (!src.reset()) {
      return done(fail(err, ErrorKind::Io, src.error(), 0, 0, src.last_error()));
    }

    if (cancelled())
      return done(fail(err, ErrorKind::Cancelled, "cancelled before streaming", 1, 0));

    // --- Streaming
    state = SplitState::Streaming;
    metrics.start_stage("stream_chunks");
    const std::uint64_t bytes0 = src.bytes_read();
    auto end_streaming = [&]() {
      metrics.end_stage("stream_chunks");
      rep.bytes_read = src.bytes_read() - bytes0;
      metrics.set_bytes(rep.bytes_read);
    };

    std::string line;
    if (!src.next(line)) {
      end_streaming();
      if (src.failed())
        return done(fail(err, ErrorKind::Streaming, src.error(), 1, 0, src.last_error()));
      return done(fail(err, ErrorKind::EmptyInput, "input has no header line"));
    }
    auto header = std::make_shared<const std::string>(std::move(line));
    ChunkAssembler assembler(cfg.capacity, header);

    bool was_cancelled = false;
    std::string sink_err;
    auto on_chunk = [&](const OutputChunk& chunk) -> bool {
      if (cancelled()) { was_cancelled = true; return false; }
      if (!sink.emit(chunk, &sink_err)) return false;
      rep.chunks_emitted = chunk.index;
      rep.rows_processed += chunk.row_count();
      metrics.add_chunk();
      metrics.add_rows(chunk.row_count());
      if (progress) progress(Progress{rep.rows_processed, rep.total_rows, rep.chunks_emitted});
      return true;
    };

    bool ok = true;
    while (ok && src.next(line)) ok = assembler.feed(std::move(line), on_chunk);
    if (ok && src.failed()) {
      end_streaming();
      return done(fail(err, ErrorKind::Streaming, src.error(), assembler.next_index(),
                       assembler.rows_seen(), src.last_error()));
    }
    if (ok) ok = assembler.finish(on_chunk);
    end_streaming();

    if (!ok) {
      if (was_cancelled)
        return done(fail(err, ErrorKind::Cancelled, "cancelled", assembler.next_index(),
                         assembler.rows_seen()));
      return done(fail(err, ErrorKind::Sink,
                       sink_err.empty() ? std::string("sink rejected chunk") : sink_err,
                       assembler.next_index(), assembler.rows_seen()));
    }

    if (assembler.rows_seen() == 0)
      return done(fail(err, ErrorKind::EmptyInput, "input has a header but no data rows"));
    if (cfg.count_first && assembler.rows_seen() != rep.total_rows)
      return done(fail(err, ErrorKind::Streaming,
                       "input changed between passes: counted " +
                       std::to_string(rep.total_rows) + " rows, streamed " +
                       std::to_string(assembler.rows_seen()),
                       assembler.next_index(), assembler.rows_seen()));
    return done(true);
  }
};

PartitionDriver::PartitionDriver() : PartitionDriver(Config{}) {}
PartitionDriver::PartitionDriver(Config cfg) : p_(new Impl{std::move(cfg)}) {}
PartitionDriver::~PartitionDriver() { delete p_; }

void PartitionDriver::set_progress(ProgressCallback cb) { p_->progress = std::move(cb); }
void PartitionDriver::set_cancel_flag(const std::atomic<bool>* flag) noexcept { p_->cancel = flag; }

bool PartitionDriver::run(LineSource& src, ChunkSink& sink,
                          SplitReport* report, SplitError* err) {
  SplitReport local;
  return p_->run(src, sink, report ? *report : local, err);
}

SplitState PartitionDriver::state() const noexcept { return p_->state; }
const PartitionDriver::Config& PartitionDriver::config() const noexcept { return p_->cfg; }

}
