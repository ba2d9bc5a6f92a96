#pragma once

// ============================================================================
// 错误分类
// RpcError / PersistenceError 可重试, DeploymentNotFound / ConfigError 致命
// ============================================================================

#include <stdexcept>
#include <string>

// 配置或 manifest 错误, 启动阶段致命
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &msg) : std::runtime_error(msg) {}
};

// 网络 / 超时 / JSON-RPC error, 调用方按可重试处理
class RpcError : public std::runtime_error {
public:
  explicit RpcError(const std::string &msg) : std::runtime_error(msg) {}
};

// anchor 合约在当前高度没有代码
class DeploymentNotFound : public std::runtime_error {
public:
  explicit DeploymentNotFound(const std::string &address)
      : std::runtime_error("contract not deployed: " + address), address_(address) {}

  const std::string &address() const { return address_; }

private:
  std::string address_;
};

// 日志 payload 无法解码, 跳过该条
class DecodeError : public std::runtime_error {
public:
  explicit DecodeError(const std::string &msg) : std::runtime_error(msg) {}
};

// 写库失败, 上抛给 tail / backfill 决定重试
class PersistenceError : public std::runtime_error {
public:
  explicit PersistenceError(const std::string &msg) : std::runtime_error(msg) {}
};

// 唯一约束冲突 (幂等键已存在)
class DuplicateKeyError : public PersistenceError {
public:
  explicit DuplicateKeyError(const std::string &msg) : PersistenceError(msg) {}
};
