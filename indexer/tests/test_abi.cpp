#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/events.hpp"
#include "core/manifest.hpp"
#include "infra/abi.hpp"
#include "infra/rpc_client.hpp"
#include "mock_chain.hpp"

using json = nlohmann::json;

namespace {

const std::string GRANT_DATA =
    "0x0000000000000000000000000000000000000000000000000000000000000020"
    "000000000000000000000000000000000000000000000000000000000000004a"
    "7b227469746c65223a22436c65616e205761746572222c226465736372697074"
    "696f6e223a2257656c6c7320666f722076696c6c61676573222c226275646765"
    "74223a2231322e35227d00000000000000000000000000000000000000000000";

const std::string DONATION_DATA =
    "0x00000000000000000000000000000000000000000000000022b1c8c1227a0000"
    "0000000000000000000000000000000000000000000000000000000000000001"
    "0000000000000000000000000000000000000000000000000000000000000007";

template <class E, class F> bool throws(F f) {
  try {
    f();
  } catch (const E &) {
    return true;
  }
  return false;
}

const WatchedEvent &find_watched(const std::vector<WatchedEvent> &watched, EventKind kind) {
  for (const auto &w : watched) {
    if (w.kind == kind)
      return w;
  }
  throw std::logic_error("kind not watched");
}

void test_catalog_signatures() {
  auto watched = fixture::watched();
  assert(watched.size() == 2);

  const auto &grant = find_watched(watched, EventKind::GrantCreated);
  assert(grant.abi.signature() == "GrantCreated(uint256,address,string)");
  assert(grant.topic0 == topics::GRANT_CREATED);
  assert(grant.address == fixture::REGISTRY);
  assert(grant.event_type() == "GrantRegistry.GrantCreated");

  const auto &donation = find_watched(watched, EventKind::DonationReceived);
  assert(donation.abi.signature() == "DonationReceived(address,address,uint256,uint256,uint256)");
  assert(donation.topic0 == topics::DONATION_RECEIVED);
}

void test_decode_grant_created() {
  auto ev = abi::find_event(fixture::registry_abi(), "GrantCreated");
  std::vector<std::string> topics = {
      topics::GRANT_CREATED,
      "0x0000000000000000000000000000000000000000000000000000000000000007",
      "0x000000000000000000000000AbCdEf0123456789abcdef0123456789ABCDEF01"};

  json args = abi::decode_log(ev, topics, GRANT_DATA);
  assert(args["id"] == "7");
  assert(args["owner"] == "0xabcdef0123456789abcdef0123456789abcdef01");
  assert(args["metadata"] == R"({"title":"Clean Water","description":"Wells for villages","budget":"12.5"})");

  EventPayload payload = decode_payload(EventKind::GrantCreated, args);
  const auto &g = std::get<GrantCreated>(payload);
  assert(g.grant_id == 7);
  assert(g.owner == "0xabcdef0123456789abcdef0123456789abcdef01");
}

void test_decode_donation_received() {
  auto ev = abi::find_event(json{{"abi", fixture::vault_abi()}}, "DonationReceived");
  std::vector<std::string> topics = {
      topics::DONATION_RECEIVED,
      "0x00000000000000000000000070997970c51812dc3a010c7d01b50e0d17dc79c8",
      "0x0000000000000000000000000000000000000000000000000000000000000000"};

  json args = abi::decode_log(ev, topics, DONATION_DATA);
  assert(args["donor"] == fixture::ALICE);
  assert(args["token"] == fixture::ETH);
  assert(args["amount"] == "2500000000000000000");
  assert(args["roundId"] == "1");
  assert(args["grantId"] == "7");

  const auto d = std::get<DonationReceived>(decode_payload(EventKind::DonationReceived, args));
  assert(d.amount_eth == "2.500000000000000000");
  assert(d.round_id == 1);
  assert(d.grant_id == 7);
}

void test_decode_static_types() {
  abi::EventAbi ev;
  ev.name = "Mixed";
  ev.inputs = {{"delta", "int256", false}, {"flag", "bool", false}, {"tag", "bytes4", false}, {"small", "uint8", false}};

  std::string data = "0x" + std::string(64, 'f') + std::string(63, '0') + "1" + "deadbeef" + std::string(56, '0') +
                     std::string(62, '0') + "ff";
  json args = abi::decode_log(ev, {"0x" + std::string(64, '1')}, data);
  assert(args["delta"] == "-1");
  assert(args["flag"] == true);
  assert(args["tag"] == "0xdeadbeef");
  assert(args["small"] == "255");
}

void test_decode_malformed() {
  auto ev = abi::find_event(fixture::registry_abi(), "GrantCreated");
  std::vector<std::string> topics = {
      topics::GRANT_CREATED,
      "0x0000000000000000000000000000000000000000000000000000000000000007",
      "0x00000000000000000000000070997970c51812dc3a010c7d01b50e0d17dc79c8"};

  // 截断的 data
  assert(throws<DecodeError>([&] { abi::decode_log(ev, topics, GRANT_DATA.substr(0, 130)); }));
  // 缺少 indexed topic
  assert(throws<DecodeError>([&] { abi::decode_log(ev, {topics[0], topics[1]}, GRANT_DATA); }));
  // 非 hex
  assert(throws<DecodeError>([&] { abi::decode_log(ev, topics, "0xzz"); }));

  abi::EventAbi arrays;
  arrays.name = "Arrays";
  arrays.inputs = {{"ids", "uint256[]", false}};
  assert(throws<DecodeError>([&] { abi::decode_log(arrays, {"0x" + std::string(64, '1')}, "0x" + std::string(64, '0')); }));

  assert(throws<DecodeError>([&] { abi::find_event(fixture::registry_abi(), "GrantClosed"); }));
}

void test_decode_rejects_invalid_utf8() {
  auto ev = abi::find_event(fixture::registry_abi(), "GrantCreated");
  std::vector<std::string> topics = {
      topics::GRANT_CREATED,
      "0x0000000000000000000000000000000000000000000000000000000000000007",
      "0x00000000000000000000000070997970c51812dc3a010c7d01b50e0d17dc79c8"};

  auto string_data = [](const std::string &hex_bytes) {
    std::string len = abi::int64_to_hex(static_cast<int64_t>(hex_bytes.size() / 2)).substr(2);
    return "0x" + std::string(62, '0') + "20" + std::string(64 - len.size(), '0') + len + hex_bytes +
           std::string(64 - hex_bytes.size(), '0');
  };

  // 0xff 0xfe 不是 UTF-8
  assert(throws<DecodeError>([&] { abi::decode_log(ev, topics, string_data("fffe")); }));
  // 代理区 U+D800 和过长编码
  assert(throws<DecodeError>([&] { abi::decode_log(ev, topics, string_data("eda080")); }));
  assert(throws<DecodeError>([&] { abi::decode_log(ev, topics, string_data("c0af")); }));
  // 截断的多字节序列
  assert(throws<DecodeError>([&] { abi::decode_log(ev, topics, string_data("e282")); }));

  json ok = abi::decode_log(ev, topics, string_data("e282ac41"));
  assert(ok["metadata"] == "\xe2\x82\xac" "A");

  // parse_log 把它记成解码错误, 不抛出
  auto watched = fixture::watched();
  json raw = {{"transactionHash", fixture::tx(1)},
              {"logIndex", "0x0"},
              {"blockNumber", "0x5"},
              {"address", fixture::REGISTRY},
              {"topics", topics},
              {"data", string_data("fffe")}};
  EventLog bad = parse_log(find_watched(watched, EventKind::GrantCreated), raw);
  assert(bad.kind == EventKind::GrantCreated);
  assert(bad.decode_error);
  assert(bad.args["data"].get<std::string>().find("fffe") != std::string::npos);
  assert(!bad.args.dump().empty());
}

void test_parse_log() {
  auto watched = fixture::watched();
  const auto &donation = find_watched(watched, EventKind::DonationReceived);

  json raw = {{"transactionHash", "0xABC0000000000000000000000000000000000000000000000000000000000001"},
              {"logIndex", "0x2"},
              {"blockNumber", "0x1f"},
              {"address", fixture::VAULT},
              {"topics", {topics::DONATION_RECEIVED,
                          "0x00000000000000000000000070997970c51812dc3a010c7d01b50e0d17dc79c8",
                          "0x0000000000000000000000000000000000000000000000000000000000000000"}},
              {"data", DONATION_DATA}};

  EventLog log = parse_log(donation, raw);
  assert(log.kind == EventKind::DonationReceived);
  assert(log.tx_hash == "0xabc0000000000000000000000000000000000000000000000000000000000001");
  assert(log.log_index == 2);
  assert(log.block_number == 31);
  assert(!log.decode_error);
  assert(log.args["amount"] == "2500000000000000000");

  // topic0 不匹配: 未知事件
  json other = raw;
  other["topics"][0] = "0x" + std::string(64, '9');
  EventLog unknown = parse_log(donation, other);
  assert(!unknown.kind);
  assert(unknown.event_name == "Unknown");
  assert(unknown.args.contains("topics"));

  // 解码失败记录在条目上, 不抛出
  json broken = raw;
  broken["data"] = "0x1234";
  EventLog bad = parse_log(donation, broken);
  assert(bad.kind == EventKind::DonationReceived);
  assert(bad.decode_error);

  json no_index = raw;
  no_index.erase("logIndex");
  assert(throws<RpcError>([&] { parse_log(donation, no_index); }));
}

void test_payload_validation() {
  assert(payload::wei_to_decimal("1") == "0.000000000000000001");
  assert(payload::wei_to_decimal("0") == "0.000000000000000000");
  assert(payload::wei_to_decimal("1000000000000000000") == "1.000000000000000000");
  assert(throws<DecodeError>([] { payload::wei_to_decimal(std::string(40, '9')); }));

  json args = {{"id", "7"}, {"owner", fixture::ALICE}};
  assert(throws<DecodeError>([&] { decode_payload(EventKind::GrantCreated, args); }));

  args["metadata"] = "x";
  args["id"] = "99999999999999999999";
  assert(throws<DecodeError>([&] { decode_payload(EventKind::GrantCreated, args); }));

  args["id"] = "-3";
  assert(throws<DecodeError>([&] { decode_payload(EventKind::GrantCreated, args); }));

  args["id"] = 3;
  args["owner"] = "0x1234";
  assert(throws<DecodeError>([&] { decode_payload(EventKind::GrantCreated, args); }));
}

void test_hex_quantities() {
  assert(abi::hex_to_int64("0x0") == 0);
  assert(abi::hex_to_int64("0x1F") == 31);
  assert(abi::int64_to_hex(0) == "0x0");
  assert(abi::int64_to_hex(4096) == "0x1000");
  assert(throws<DecodeError>([] { abi::hex_to_int64("0x"); }));
  assert(throws<DecodeError>([] { abi::hex_to_int64("0xffffffffffffffff"); }));
}

void test_manifest_binding() {
  // 合约不在清单中: 只监听剩下的
  json only_registry = {{"GrantRegistry", {{"address", fixture::REGISTRY}, {"abi", fixture::registry_abi()}}},
                        {"chainId", 31337}};
  auto watched = bind_catalog(Manifest::from_json(only_registry, ""));
  assert(watched.size() == 1);
  assert(watched[0].kind == EventKind::GrantCreated);

  // ABI 与目录签名不符
  json wrong = fixture::vault_abi();
  wrong[0]["inputs"][2]["type"] = "uint128";
  json mismatched = {{"DonationVault", {{"address", fixture::VAULT}, {"abi", wrong}}}};
  assert(throws<ConfigError>([&] { bind_catalog(Manifest::from_json(mismatched, "")); }));

  json bad_address = {{"GrantRegistry", "0x1234"}};
  assert(throws<ConfigError>([&] { Manifest::from_json(bad_address, ""); }));

  Config config = Config::from_json({{"db_path", "x.duckdb"}, {"rpc_url", "http://localhost:8545"},
                                     {"deployment_manifest", "deploy/local.json"}});
  Manifest m = Manifest::from_json(only_registry, "");
  assert(require_anchor(m, config).address == fixture::REGISTRY);
  config.anchor_contract = "DonationVault";
  assert(throws<ConfigError>([&] { require_anchor(m, config); }));
}

void test_config() {
  Config config = Config::from_json({{"db_path", "x.duckdb"}, {"rpc_url", "http://localhost:8545"},
                                     {"deployment_manifest", "deploy/local.json"}});
  assert(config.poll_interval_seconds == 2);
  assert(config.tail_max_range == 1000);
  assert(config.backfill_chunk_size == 1000);
  assert(config.initial_block == -1);
  assert(config.anchor_contract == "GrantRegistry");
  assert(config.abi_dir == "deploy");
  assert(config.record_unknown_events);

  assert(throws<ConfigError>([] { Config::from_json({{"db_path", "x.duckdb"}}); }));
  assert(throws<ConfigError>([] {
    Config::from_json({{"db_path", "x.duckdb"}, {"rpc_url", 5}, {"deployment_manifest", "m.json"}});
  }));
  assert(throws<ConfigError>([] {
    Config::from_json(
        {{"db_path", "x.duckdb"}, {"rpc_url", "http://x"}, {"deployment_manifest", "m.json"}, {"tail_max_range", 0}});
  }));
  assert(throws<ConfigError>([] {
    Config::from_json(
        {{"db_path", "x.duckdb"}, {"rpc_url", "http://x"}, {"deployment_manifest", "m.json"}, {"initial_block", -5}});
  }));
  Config from_genesis = Config::from_json(
      {{"db_path", "x.duckdb"}, {"rpc_url", "http://x"}, {"deployment_manifest", "m.json"}, {"initial_block", 0}});
  assert(from_genesis.initial_block == 0);
  assert(throws<ConfigError>([] { Config::load("/nonexistent/grant-indexer.json"); }));
  assert(throws<ConfigError>([] { RpcClient("ftp://localhost:8545"); }));
}

} // namespace

int main() {
  test_catalog_signatures();
  test_decode_grant_created();
  test_decode_donation_received();
  test_decode_static_types();
  test_decode_malformed();
  test_decode_rejects_invalid_utf8();
  test_parse_log();
  test_payload_validation();
  test_hex_quantities();
  test_manifest_binding();
  test_config();

  std::cout << "test_abi passed\n";
  return 0;
}
