#pragma once

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "../infra/abi.hpp"
#include "../infra/chain_reader.hpp"

struct Deployment {
  int64_t block = 0;
  std::string hash;
};

// 二分查找合约字节码首次出现的区块
// "有代码" 对区块号单调, 部署后不会消失
class DeploymentDetector {
public:
  explicit DeploymentDetector(ChainReader &chain) : chain_(chain) {}

  std::optional<Deployment> detect(const std::string &address) {
    probes_ = 0;
    std::string addr = abi::to_lower(address);

    int64_t head = chain_.block_number();
    if (!code_at(addr, head))
      return std::nullopt;

    int64_t lo = 0;
    int64_t hi = head;
    while (lo < hi) {
      int64_t mid = lo + (hi - lo) / 2;
      if (code_at(addr, mid)) {
        hi = mid;
      } else {
        lo = mid + 1;
      }
    }

    Deployment d;
    d.block = lo;
    d.hash = chain_.get_block(lo).hash;
    std::cout << "[Deploy] " << addr << " block=" << d.block << " hash=" << d.hash
              << " probes=" << probes_ << std::endl;
    return d;
  }

  // 上一次 detect 的 get_code 次数
  int probes() const { return probes_; }

private:
  bool code_at(const std::string &address, int64_t block) {
    ++probes_;
    return has_code(chain_.get_code(address, block));
  }

  ChainReader &chain_;
  int probes_ = 0;
};
