#pragma once

#include <cstdint>
#include <vector>

#include "../core/events.hpp"
#include "../infra/chain_reader.hpp"

// 所有监听事件在 [from, to] 内的日志, 合并后按 (block_number, log_index) 排序
// tail 和 backfill 都只通过这里拿日志
inline std::vector<EventLog> fetch_ordered(ChainReader &chain, const std::vector<WatchedEvent> &watched,
                                           int64_t from_block, int64_t to_block) {
  std::vector<EventLog> logs;
  for (const auto &w : watched) {
    auto part = chain.get_event_logs(w, from_block, to_block);
    logs.insert(logs.end(), std::make_move_iterator(part.begin()), std::make_move_iterator(part.end()));
  }
  sort_logs(logs);
  return logs;
}
