#pragma once

// ============================================================================
// 进程内指标, Prometheus 文本格式输出
// ============================================================================

#include <array>
#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

class Histogram {
public:
  static constexpr std::array<double, 10> BOUNDS = {0.001, 0.0025, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 1.0, 5.0};

  void observe(double seconds) {
    for (size_t i = 0; i < BOUNDS.size(); ++i) {
      if (seconds <= BOUNDS[i])
        buckets_[i].fetch_add(1, std::memory_order_relaxed);
    }
    count_.fetch_add(1, std::memory_order_relaxed);
    // sum 以微秒累加
    sum_us_.fetch_add(static_cast<uint64_t>(seconds * 1e6), std::memory_order_relaxed);
  }

  uint64_t count() const { return count_.load(); }

  void render(std::ostringstream &out, const std::string &name) const {
    for (size_t i = 0; i < BOUNDS.size(); ++i) {
      out << name << "_bucket{le=\"" << BOUNDS[i] << "\"} " << buckets_[i].load() << "\n";
    }
    out << name << "_bucket{le=\"+Inf\"} " << count_.load() << "\n";
    out << name << "_sum " << static_cast<double>(sum_us_.load()) / 1e6 << "\n";
    out << name << "_count " << count_.load() << "\n";
  }

private:
  std::array<std::atomic<uint64_t>, BOUNDS.size()> buckets_{};
  std::atomic<uint64_t> count_{0};
  std::atomic<uint64_t> sum_us_{0};
};

struct Metrics {
  std::atomic<uint64_t> events_processed_total{0};
  std::atomic<uint64_t> events_duplicate_total{0};
  std::atomic<uint64_t> events_error_total{0};
  std::atomic<uint64_t> events_inconsistent_total{0};
  std::atomic<uint64_t> events_decode_error_total{0};
  std::atomic<uint64_t> events_unknown_total{0};
  std::atomic<uint64_t> tail_tick_failures_total{0};
  std::atomic<uint64_t> backfill_chunk_failures_total{0};
  std::atomic<int64_t> last_processed_block{-1};
  Histogram event_processing_duration_seconds;

  void note_block(int64_t block) {
    int64_t prev = last_processed_block.load();
    while (block > prev && !last_processed_block.compare_exchange_weak(prev, block)) {
    }
  }

  std::string render_prometheus() const {
    std::ostringstream out;
    counter(out, "events_processed_total", "Events projected into the store", events_processed_total);
    counter(out, "events_duplicate_total", "Events skipped as already processed", events_duplicate_total);
    counter(out, "events_error_total", "Events that failed to persist", events_error_total);
    counter(out, "events_inconsistent_total", "Events referencing unknown entities", events_inconsistent_total);
    counter(out, "events_decode_error_total", "Logs that could not be decoded", events_decode_error_total);
    counter(out, "events_unknown_total", "Logs matching no known event", events_unknown_total);
    counter(out, "tail_tick_failures_total", "Tail ticks aborted by an error", tail_tick_failures_total);
    counter(out, "backfill_chunk_failures_total", "Backfill chunks that failed", backfill_chunk_failures_total);

    out << "# HELP last_processed_block Highest block fully processed\n";
    out << "# TYPE last_processed_block gauge\n";
    out << "last_processed_block " << last_processed_block.load() << "\n";

    out << "# HELP event_processing_duration_seconds Time to process one event\n";
    out << "# TYPE event_processing_duration_seconds histogram\n";
    event_processing_duration_seconds.render(out, "event_processing_duration_seconds");
    return out.str();
  }

private:
  static void counter(std::ostringstream &out, const char *name, const char *help,
                      const std::atomic<uint64_t> &value) {
    out << "# HELP " << name << " " << help << "\n";
    out << "# TYPE " << name << " counter\n";
    out << name << " " << value.load() << "\n";
  }
};
