#pragma once

// ============================================================================
// 链会话: (anchor 地址, 部署区块哈希) -> session_id
// 本地链重启后地址复用, 区块哈希不同就是新会话
// ============================================================================

#include <iostream>
#include <string>

#include "../core/errors.hpp"
#include "../core/store.hpp"
#include "../infra/abi.hpp"
#include "../infra/chain_reader.hpp"
#include "deployment_detector.hpp"

class ChainSessionManager {
public:
  ChainSessionManager(ChainReader &chain, Store &store) : detector_(chain), store_(store) {}

  ChainSession get_or_create(const std::string &address) {
    std::string addr = abi::to_lower(address);

    auto deployment = detector_.detect(addr);
    if (!deployment)
      throw DeploymentNotFound(addr);

    if (auto existing = store_.find_session(addr, deployment->hash)) {
      created_ = false;
      std::cout << "[Session] using existing session " << existing->session_id << " (block "
                << existing->deployment_block << ")" << std::endl;
      return *existing;
    }

    ChainSession s;
    s.session_id = new_uuid();
    s.contract_address = addr;
    s.deployment_block = deployment->block;
    s.deployment_block_hash = deployment->hash;
    s.is_active = true;

    // 并发创建时唯一键保证只有一行, 输家读回赢家的行
    created_ = store_.insert_session(s);
    if (created_) {
      store_.deactivate_other_sessions(s.session_id);
      std::cout << "[Session] created session " << s.session_id << " (block " << s.deployment_block
                << ", hash " << s.deployment_block_hash << ")" << std::endl;
      return s;
    }

    auto winner = store_.find_session(addr, deployment->hash);
    if (!winner)
      throw PersistenceError("chain session vanished after conflicting insert: " + addr);
    return *winner;
  }

  // 上一次 get_or_create 是否新建了会话
  bool created() const { return created_; }

  const DeploymentDetector &detector() const { return detector_; }

private:
  DeploymentDetector detector_;
  Store &store_;
  bool created_ = false;
};
