#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include "../core/events.hpp"
#include "abi.hpp"

struct BlockHeader {
  int64_t number = 0;
  std::string hash;
  int64_t timestamp = 0;
};

// 链只读接口, RpcClient 和测试用的 MockChain 都实现它
class ChainReader {
public:
  virtual ~ChainReader() = default;

  virtual int64_t block_number() = 0;
  // 合约字节码 hex, 无代码时为 "0x"
  virtual std::string get_code(const std::string &address, int64_t block) = 0;
  virtual BlockHeader get_block(int64_t block) = 0;
  // 已按 (block_number, log_index) 排序
  virtual std::vector<EventLog> get_event_logs(const WatchedEvent &watched, int64_t from_block,
                                               int64_t to_block) = 0;
};

inline bool has_code(const std::string &code_hex) {
  std::string c = abi::strip_0x(code_hex);
  return !c.empty() && c.find_first_not_of('0') != std::string::npos;
}

inline void sort_logs(std::vector<EventLog> &logs) {
  std::sort(logs.begin(), logs.end(), [](const EventLog &a, const EventLog &b) {
    if (a.block_number != b.block_number)
      return a.block_number < b.block_number;
    return a.log_index < b.log_index;
  });
}
