#pragma once

// ============================================================================
// 单条日志处理: 幂等检查 -> 解码 -> 一个事务内写原始事件 + 投影
// 调用方负责按 (block_number, log_index) 顺序喂入
// ============================================================================

#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../core/errors.hpp"
#include "../core/events.hpp"
#include "../core/store.hpp"
#include "../infra/chain_reader.hpp"
#include "../obs/event_journal.hpp"
#include "../obs/metrics.hpp"
#include "projection.hpp"

using json = nlohmann::json;

enum class EventOutcome {
  Applied,
  DuplicateSkipped,
  Inconsistent,
  DecodeFailed,
  Recorded, // 未知事件, 只存原始行
  Ignored,  // 未知事件且 record_unknown_events = false
};

inline const char *outcome_name(EventOutcome o) {
  switch (o) {
  case EventOutcome::Applied:
    return "applied";
  case EventOutcome::DuplicateSkipped:
    return "duplicate";
  case EventOutcome::Inconsistent:
    return "inconsistent";
  case EventOutcome::DecodeFailed:
    return "decode_failed";
  case EventOutcome::Recorded:
    return "recorded";
  case EventOutcome::Ignored:
    return "ignored";
  }
  return "unknown";
}

struct OutcomeCounts {
  int64_t applied = 0;
  int64_t duplicates = 0;
  int64_t inconsistent = 0;
  int64_t decode_failed = 0;
  int64_t recorded = 0;
  int64_t ignored = 0;

  void add(EventOutcome o) {
    switch (o) {
    case EventOutcome::Applied:
      ++applied;
      break;
    case EventOutcome::DuplicateSkipped:
      ++duplicates;
      break;
    case EventOutcome::Inconsistent:
      ++inconsistent;
      break;
    case EventOutcome::DecodeFailed:
      ++decode_failed;
      break;
    case EventOutcome::Recorded:
      ++recorded;
      break;
    case EventOutcome::Ignored:
      ++ignored;
      break;
    }
  }

  int64_t total() const { return applied + duplicates + inconsistent + decode_failed + recorded + ignored; }

  json to_json() const {
    return {{"applied", applied},           {"duplicates", duplicates}, {"inconsistent", inconsistent},
            {"decode_failed", decode_failed}, {"recorded", recorded},   {"ignored", ignored}};
  }
};

class EventProcessor {
public:
  EventProcessor(ChainReader &chain, Store &store, const ChainSession &session, Metrics &metrics,
                 EventJournal *journal = nullptr, bool record_unknown_events = true)
      : chain_(chain), store_(store), session_(session), metrics_(metrics), journal_(journal),
        record_unknown_events_(record_unknown_events) {}

  // PersistenceError / RpcError 上抛, 其余情况都归为某个 outcome
  EventOutcome process(const EventLog &log) {
    auto start = std::chrono::steady_clock::now();
    EventOutcome outcome = process_inner(log);
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    metrics_.event_processing_duration_seconds.observe(elapsed.count());
    if (outcome != EventOutcome::Ignored)
      metrics_.note_block(log.block_number);
    return outcome;
  }

  // 按给定顺序处理, 不重新排序; 出错时已处理的保持落库
  OutcomeCounts process_all(const std::vector<EventLog> &logs) {
    OutcomeCounts counts;
    for (const auto &log : logs) {
      counts.add(process(log));
    }
    return counts;
  }

  // 测试里用固定 id
  void set_id_source(std::function<std::string()> source) { new_id_ = std::move(source); }

private:
  EventOutcome process_inner(const EventLog &log) {
    if (store_.raw_event_exists(log.tx_hash, log.log_index, session_.session_id))
      return duplicate(log);

    if (!log.kind) {
      if (!record_unknown_events_)
        return EventOutcome::Ignored;
      metrics_.events_unknown_total++;
      return persist(log, std::nullopt);
    }

    if (log.decode_error)
      return decode_failed(log, *log.decode_error);

    EventPayload payload;
    try {
      payload = decode_payload(*log.kind, log.args);
    } catch (const DecodeError &e) {
      return decode_failed(log, e.what());
    }
    return persist(log, payload);
  }

  EventOutcome persist(const EventLog &log, const std::optional<EventPayload> &payload) {
    int64_t ts = 0;
    try {
      ts = block_timestamp(log.block_number);
    } catch (const RpcError &e) {
      metrics_.events_error_total++;
      std::cerr << "[Event] block " << log.block_number << " timestamp unavailable: " << e.what() << std::endl;
      throw;
    }

    RawEvent raw;
    raw.tx_hash = log.tx_hash;
    raw.log_index = log.log_index;
    raw.session_id = session_.session_id;
    raw.event_type = log.event_type();
    raw.block_number = log.block_number;
    raw.block_timestamp = ts;
    raw.decoded_args = log.args;

    projection::Mutations mutations;
    try {
      Store::Transaction tx(store_);
      if (payload) {
        projection::Context ctx;
        ctx.session_id = session_.session_id;
        ctx.tx_hash = log.tx_hash;
        ctx.log_index = log.log_index;
        ctx.block_timestamp = ts;
        if (new_id_)
          ctx.new_id = new_id_;

        projection::State state = projection::load_state(store_, *payload, session_.session_id);
        mutations = projection::project(*payload, ctx, state);
        raw.proposal_on_chain_id = mutations.proposal_on_chain_id;
      }
      store_.insert_raw_event(raw);
      projection::apply(store_, mutations);
      tx.commit();
    } catch (const DuplicateKeyError &e) {
      // 只有原始行确实存在才算另一个写者先落库, 其余约束冲突整段重试
      if (store_.raw_event_exists(log.tx_hash, log.log_index, session_.session_id))
        return duplicate(log);
      metrics_.events_error_total++;
      std::cerr << "[Event] constraint conflict " << log.event_type() << " tx=" << log.tx_hash
                << " log=" << log.log_index << ": " << e.what() << std::endl;
      throw PersistenceError(e.what());
    } catch (const PersistenceError &e) {
      metrics_.events_error_total++;
      std::cerr << "[Event] persist failed " << log.event_type() << " tx=" << log.tx_hash
                << " log=" << log.log_index << ": " << e.what() << std::endl;
      throw;
    }

    journal(log, ts);

    if (!payload) {
      std::cout << "[Event] recorded unknown log tx=" << log.tx_hash << " log=" << log.log_index
                << " block=" << log.block_number << std::endl;
      return EventOutcome::Recorded;
    }
    if (mutations.warning) {
      metrics_.events_inconsistent_total++;
      std::cerr << "[Event] WARNING " << *mutations.warning << " (" << log.event_type() << " tx=" << log.tx_hash
                << " log=" << log.log_index << ")" << std::endl;
      return EventOutcome::Inconsistent;
    }

    metrics_.events_processed_total++;
    std::cout << "[Event] " << log.event_type() << " tx=" << log.tx_hash << " log=" << log.log_index
              << " block=" << log.block_number << std::endl;
    return EventOutcome::Applied;
  }

  EventOutcome duplicate(const EventLog &log) {
    metrics_.events_duplicate_total++;
    std::cout << "[Event] duplicate skipped " << log.event_type() << " tx=" << log.tx_hash
              << " log=" << log.log_index << std::endl;
    return EventOutcome::DuplicateSkipped;
  }

  EventOutcome decode_failed(const EventLog &log, const std::string &reason) {
    metrics_.events_decode_error_total++;
    std::cerr << "[Event] WARNING cannot decode " << log.event_type() << " tx=" << log.tx_hash
              << " log=" << log.log_index << ": " << reason << std::endl;
    return EventOutcome::DecodeFailed;
  }

  void journal(const EventLog &log, int64_t ts) {
    if (!journal_)
      return;
    journal_->append({{"contract", log.contract},
                      {"event", log.event_name},
                      {"tx_hash", log.tx_hash},
                      {"log_index", log.log_index},
                      {"block", log.block_number},
                      {"timestamp", format_utc(ts)},
                      {"args", log.args},
                      {"session_id", session_.session_id}});
  }

  int64_t block_timestamp(int64_t block) {
    auto it = timestamps_.find(block);
    if (it != timestamps_.end())
      return it->second;
    if (timestamps_.size() >= MAX_CACHED_BLOCKS)
      timestamps_.clear();
    int64_t ts = chain_.get_block(block).timestamp;
    timestamps_[block] = ts;
    return ts;
  }

  static constexpr size_t MAX_CACHED_BLOCKS = 1024;

  ChainReader &chain_;
  Store &store_;
  ChainSession session_;
  Metrics &metrics_;
  EventJournal *journal_;
  bool record_unknown_events_;
  std::function<std::string()> new_id_;
  std::map<int64_t, int64_t> timestamps_;
};
