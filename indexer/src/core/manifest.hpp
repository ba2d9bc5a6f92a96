#pragma once

// ============================================================================
// 部署清单: 合约名 -> 地址 (+ ABI)
// {"GrantRegistry": "0x..", "DonationVault": {"address": "0x..", "abi": [...]}}
// ============================================================================

#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../infra/abi.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "events.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

struct ContractInfo {
  std::string name;
  std::string address; // 小写
  json abi;
};

struct Manifest {
  std::map<std::string, ContractInfo> contracts;

  const ContractInfo *find(const std::string &name) const {
    auto it = contracts.find(name);
    return it == contracts.end() ? nullptr : &it->second;
  }

  static Manifest load(const std::string &path, const std::string &abi_dir) {
    std::ifstream f(path);
    if (!f.is_open()) {
      throw ConfigError("cannot open deployment manifest: " + path);
    }
    json j;
    try {
      f >> j;
    } catch (const json::parse_error &e) {
      throw ConfigError("deployment manifest is not valid JSON: " + std::string(e.what()));
    }
    return from_json(j, abi_dir);
  }

  static Manifest from_json(const json &j, const std::string &abi_dir) {
    if (!j.is_object())
      throw ConfigError("deployment manifest root must be an object");

    Manifest m;
    for (const auto &[name, entry] : j.items()) {
      ContractInfo info;
      info.name = name;

      if (entry.is_string()) {
        info.address = entry.get<std::string>();
      } else if (entry.is_object() && entry.contains("address") && entry["address"].is_string()) {
        info.address = entry["address"].get<std::string>();
        if (entry.contains("abi"))
          info.abi = entry["abi"];
      } else {
        // 清单里也可能有 chainId 之类的非合约字段
        continue;
      }

      info.address = abi::to_lower(info.address);
      if (info.address.size() != 42 || !info.address.starts_with("0x") ||
          !abi::is_hex(info.address.substr(2))) {
        throw ConfigError("invalid address for contract " + name + ": " + info.address);
      }

      if (info.abi.is_null()) {
        // 没有 ABI 的合约只保留地址, 不监听事件
        auto abi = load_abi(abi_dir, name);
        if (abi) {
          info.abi = std::move(*abi);
        } else {
          std::cerr << "[Manifest] ABI not found for " << name << " in " << abi_dir << std::endl;
        }
      }
      m.contracts.emplace(name, std::move(info));
    }
    return m;
  }

  // <abi_dir>/N.sol/N.json (Hardhat artifact), 然后 <abi_dir>/N.json
  static std::optional<json> load_abi(const std::string &abi_dir, const std::string &name) {
    std::vector<fs::path> candidates = {
        fs::path(abi_dir) / (name + ".sol") / (name + ".json"),
        fs::path(abi_dir) / (name + ".json")};

    for (const auto &p : candidates) {
      std::ifstream f(p);
      if (!f.is_open())
        continue;
      json j;
      try {
        f >> j;
      } catch (const json::parse_error &e) {
        throw ConfigError("ABI file is not valid JSON: " + p.string() + ": " + e.what());
      }
      if (j.is_object() && j.contains("abi"))
        return j["abi"];
      if (j.is_array())
        return j;
      throw ConfigError("ABI file has no abi array: " + p.string());
    }
    return std::nullopt;
  }
};

// CATALOG 中每个事件绑定到清单地址和 ABI
// 合约不在清单里或没有 ABI 的事件跳过, ABI 签名与目录不符直接失败
inline std::vector<WatchedEvent> bind_catalog(const Manifest &manifest) {
  std::vector<WatchedEvent> watched;
  for (const auto &entry : CATALOG) {
    const ContractInfo *info = manifest.find(entry.contract);
    if (!info) {
      std::cerr << "[Manifest] " << entry.contract << " not in manifest, " << entry.event
                << " not watched" << std::endl;
      continue;
    }
    if (info->abi.is_null()) {
      std::cerr << "[Manifest] " << entry.contract << " has no ABI, " << entry.event << " not watched"
                << std::endl;
      continue;
    }

    WatchedEvent w;
    w.kind = entry.kind;
    w.contract = entry.contract;
    w.address = info->address;
    w.topic0 = entry.topic0;
    try {
      w.abi = abi::find_event(info->abi, entry.event);
    } catch (const DecodeError &e) {
      throw ConfigError(std::string(entry.contract) + ": " + e.what());
    }
    if (w.abi.signature() != entry.signature) {
      throw ConfigError(std::string("ABI signature mismatch for ") + entry.contract + "." + entry.event +
                        ": expected " + entry.signature + ", got " + w.abi.signature());
    }
    watched.push_back(std::move(w));
  }
  return watched;
}

// 锚定合约必须在清单里
inline const ContractInfo &require_anchor(const Manifest &manifest, const Config &config) {
  const ContractInfo *anchor = manifest.find(config.anchor_contract);
  if (!anchor)
    throw ConfigError("anchor contract " + config.anchor_contract + " not found in deployment manifest");
  return *anchor;
}
