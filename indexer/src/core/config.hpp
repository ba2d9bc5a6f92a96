#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

#include "errors.hpp"

using json = nlohmann::json;

struct Config {
  std::string db_path;
  std::string rpc_url;
  std::string rpc_api_key;
  int rpc_timeout_seconds = 30;
  std::string deployment_manifest;
  std::string abi_dir;
  std::string anchor_contract = "GrantRegistry";
  int poll_interval_seconds = 2;
  int64_t tail_max_range = 1000;
  int64_t backfill_chunk_size = 1000;
  int64_t initial_block = -1;
  bool record_unknown_events = true;
  std::string event_journal_path;
  int metrics_port = 0;
  bool log_rpc_calls = false;

  // overrides 覆盖文件中的同名键 (命令行参数)
  static Config load(const std::string &path, const json &overrides = json::object()) {
    std::ifstream f(path);
    if (!f.is_open()) {
      throw ConfigError("cannot open config file: " + path);
    }

    json j;
    try {
      f >> j;
    } catch (const json::parse_error &e) {
      throw ConfigError("config is not valid JSON: " + std::string(e.what()));
    }
    if (!j.is_object()) {
      throw ConfigError("config root must be an object");
    }
    for (const auto &[key, value] : overrides.items()) {
      j[key] = value;
    }
    return from_json(j);
  }

  static Config from_json(const json &j) {
    auto require = [&](const char *key) -> const json & {
      if (!j.contains(key) || j[key].is_null()) {
        throw ConfigError(std::string("config missing required key: ") + key);
      }
      return j[key];
    };

    Config config;
    try {
      config.db_path = require("db_path").get<std::string>();
      config.rpc_url = require("rpc_url").get<std::string>();
      config.deployment_manifest = require("deployment_manifest").get<std::string>();

      config.rpc_api_key = j.value("rpc_api_key", config.rpc_api_key);
      config.rpc_timeout_seconds = j.value("rpc_timeout_seconds", config.rpc_timeout_seconds);
      config.abi_dir = j.value("abi_dir", config.abi_dir);
      config.anchor_contract = j.value("anchor_contract", config.anchor_contract);
      config.poll_interval_seconds = j.value("poll_interval_seconds", config.poll_interval_seconds);
      config.tail_max_range = j.value("tail_max_range", config.tail_max_range);
      config.backfill_chunk_size = j.value("backfill_chunk_size", config.backfill_chunk_size);
      config.initial_block = j.value("initial_block", config.initial_block);
      config.record_unknown_events = j.value("record_unknown_events", config.record_unknown_events);
      config.event_journal_path = j.value("event_journal_path", config.event_journal_path);
      config.metrics_port = j.value("metrics_port", config.metrics_port);
      config.log_rpc_calls = j.value("log_rpc_calls", config.log_rpc_calls);
    } catch (const json::type_error &e) {
      throw ConfigError("config field has wrong type: " + std::string(e.what()));
    }

    // 默认与 manifest 同目录
    if (config.abi_dir.empty()) {
      config.abi_dir = std::filesystem::path(config.deployment_manifest).parent_path().string();
    }

    config.validate();
    return config;
  }

  void validate() const {
    if (rpc_timeout_seconds <= 0)
      throw ConfigError("rpc_timeout_seconds must be positive");
    if (poll_interval_seconds <= 0)
      throw ConfigError("poll_interval_seconds must be positive");
    if (tail_max_range <= 0)
      throw ConfigError("tail_max_range must be positive");
    if (backfill_chunk_size <= 0)
      throw ConfigError("backfill_chunk_size must be positive");
    if (initial_block < -1)
      throw ConfigError("initial_block must be a block number or -1");
    if (metrics_port < 0 || metrics_port > 65535)
      throw ConfigError("metrics_port out of range");
    if (anchor_contract.empty())
      throw ConfigError("anchor_contract must not be empty");
  }
};
