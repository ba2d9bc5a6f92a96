#pragma once

// ============================================================================
// 回填: [from, to] 按 backfill_chunk_size 分块, 单块失败记录后继续
// 不读写 tail cursor
// ============================================================================

#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../core/errors.hpp"
#include "../infra/chain_reader.hpp"
#include "../obs/metrics.hpp"
#include "event_processor.hpp"
#include "range_fetcher.hpp"

using json = nlohmann::json;

struct ChunkResult {
  int64_t from = 0;
  int64_t to = 0;
  bool ok = true;
  std::string error;
  OutcomeCounts counts;
};

struct BackfillReport {
  std::vector<ChunkResult> chunks;

  std::vector<ChunkResult> failed() const {
    std::vector<ChunkResult> out;
    std::copy_if(chunks.begin(), chunks.end(), std::back_inserter(out), [](const ChunkResult &c) { return !c.ok; });
    return out;
  }

  bool ok() const {
    return std::all_of(chunks.begin(), chunks.end(), [](const ChunkResult &c) { return c.ok; });
  }

  OutcomeCounts totals() const {
    OutcomeCounts t;
    for (const auto &c : chunks) {
      t.applied += c.counts.applied;
      t.duplicates += c.counts.duplicates;
      t.inconsistent += c.counts.inconsistent;
      t.decode_failed += c.counts.decode_failed;
      t.recorded += c.counts.recorded;
      t.ignored += c.counts.ignored;
    }
    return t;
  }
};

class BackfillWorker {
public:
  BackfillWorker(ChainReader &chain, EventProcessor &processor, const std::vector<WatchedEvent> &watched,
                 Metrics &metrics, int64_t chunk_size)
      : chain_(chain), processor_(processor), watched_(watched), metrics_(metrics), chunk_size_(chunk_size) {
    if (chunk_size_ <= 0)
      throw ConfigError("backfill_chunk_size must be positive");
  }

  BackfillReport run(int64_t from_block, int64_t to_block) {
    BackfillReport report;
    if (from_block > to_block) {
      std::cout << "[Backfill] empty range " << from_block << ".." << to_block << std::endl;
      return report;
    }

    std::cout << "[Backfill] blocks " << from_block << ".." << to_block << " chunk=" << chunk_size_ << std::endl;

    for (int64_t start = from_block; start <= to_block; start += chunk_size_) {
      if (stopped_) {
        std::cout << "[Backfill] stopped before block " << start << std::endl;
        break;
      }
      ChunkResult chunk;
      chunk.from = start;
      chunk.to = std::min(start + chunk_size_ - 1, to_block);

      try {
        auto logs = fetch_ordered(chain_, watched_, chunk.from, chunk.to);
        chunk.counts = processor_.process_all(logs);
        std::cout << "[Backfill] chunk " << chunk.from << ".." << chunk.to << " " << chunk.counts.to_json().dump()
                  << std::endl;
      } catch (const RpcError &e) {
        fail(chunk, e.what());
      } catch (const PersistenceError &e) {
        fail(chunk, e.what());
      } catch (const std::exception &e) {
        fail(chunk, std::string("unexpected error: ") + e.what());
      }
      report.chunks.push_back(std::move(chunk));
    }

    auto failed = report.failed();
    std::cout << "[Backfill] done chunks=" << report.chunks.size() << " failed=" << failed.size() << " "
              << report.totals().to_json().dump() << std::endl;
    return report;
  }

  // 当前块处理完后停下, 可从其他线程调用
  void stop() { stopped_ = true; }

private:
  void fail(ChunkResult &chunk, const std::string &error) {
    chunk.ok = false;
    chunk.error = error;
    metrics_.backfill_chunk_failures_total++;
    std::cerr << "[Backfill] chunk " << chunk.from << ".." << chunk.to << " failed: " << error << std::endl;
  }

  ChainReader &chain_;
  EventProcessor &processor_;
  const std::vector<WatchedEvent> &watched_;
  Metrics &metrics_;
  int64_t chunk_size_;
  std::atomic<bool> stopped_{false};
};
