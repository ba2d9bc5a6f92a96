#pragma once

// ============================================================================
// 事件目录 + 类型化 payload
// 新增事件: EventKind + CATALOG + payload 结构 + projection handler
// ============================================================================

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>
#include <nlohmann/json.hpp>

#include "../infra/abi.hpp"
#include "errors.hpp"

using json = nlohmann::json;

namespace contracts {
constexpr const char *GRANT_REGISTRY = "GrantRegistry";
constexpr const char *DONATION_VAULT = "DonationVault";
} // namespace contracts

namespace topics {
// GrantRegistry
constexpr const char *GRANT_CREATED = "0x96452e3acf0fe48e18889da5c2539ff9a76f691c234f9482456fb4a639f7b9b1";
// DonationVault
constexpr const char *DONATION_RECEIVED = "0x8f011d8f20e029408bd456d29e3946dd7b87d0f75cadca651588a4c96700043e";
} // namespace topics

enum class EventKind : uint8_t {
  GrantCreated = 0,
  DonationReceived = 1,
};

struct CatalogEntry {
  EventKind kind;
  const char *contract;
  const char *event;
  const char *signature;
  const char *topic0;
};

inline constexpr CatalogEntry CATALOG[] = {
    {EventKind::GrantCreated, contracts::GRANT_REGISTRY, "GrantCreated",
     "GrantCreated(uint256,address,string)", topics::GRANT_CREATED},
    {EventKind::DonationReceived, contracts::DONATION_VAULT, "DonationReceived",
     "DonationReceived(address,address,uint256,uint256,uint256)", topics::DONATION_RECEIVED},
};

// 启动时由 manifest + CATALOG 绑定
struct WatchedEvent {
  EventKind kind;
  std::string contract;
  std::string address; // 小写
  abi::EventAbi abi;
  std::string topic0;

  std::string event_type() const { return contract + "." + abi.name; }
};

// RPC 返回的一条日志, args 已按 ABI 解码
struct EventLog {
  std::string tx_hash;
  int64_t log_index = 0;
  int64_t block_number = 0;
  std::string contract;
  std::string address;
  std::string event_name;
  std::optional<EventKind> kind; // topic0 不匹配时为空
  json args = json::object();
  std::optional<std::string> decode_error;

  std::string event_type() const { return contract + "." + event_name; }
};

// ----------------------------------------------------------------------------
// 类型化 payload
// ----------------------------------------------------------------------------

struct GrantCreated {
  int64_t grant_id = 0;
  std::string owner;
  std::string metadata;
};

struct DonationReceived {
  std::string donor;
  std::string token;
  std::string amount_wei;
  std::string amount_eth; // DECIMAL(38,18) 文本
  int64_t round_id = 0;
  int64_t grant_id = 0;
};

using EventPayload = std::variant<GrantCreated, DonationReceived>;

namespace payload {

constexpr int WEI_DECIMALS = 18;
// DECIMAL(38,18) 整数部分最多 20 位
constexpr size_t MAX_INTEGER_DIGITS = 20;

inline const json &field(const json &args, const char *key) {
  if (!args.is_object() || !args.contains(key) || args[key].is_null())
    throw DecodeError(std::string("missing event argument: ") + key);
  return args[key];
}

inline std::string string_field(const json &args, const char *key) {
  const json &v = field(args, key);
  if (!v.is_string())
    throw DecodeError(std::string("event argument is not a string: ") + key);
  return v.get<std::string>();
}

inline std::string address_field(const json &args, const char *key) {
  std::string addr = abi::to_lower(string_field(args, key));
  if (addr.size() != 42 || !addr.starts_with("0x") || !abi::is_hex(addr.substr(2)))
    throw DecodeError(std::string("event argument is not an address: ") + key);
  return addr;
}

// 十进制字符串 (uint256), 拒绝负数和非数字
inline std::string uint_field(const json &args, const char *key) {
  const json &v = field(args, key);
  std::string s;
  if (v.is_number_unsigned()) {
    s = std::to_string(v.get<uint64_t>());
  } else if (v.is_number_integer() && v.get<int64_t>() >= 0) {
    s = std::to_string(v.get<int64_t>());
  } else if (v.is_string()) {
    s = v.get<std::string>();
  } else {
    throw DecodeError(std::string("event argument is not an integer: ") + key);
  }
  if (s.empty() || s.size() > 78 || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
    throw DecodeError(std::string("event argument is not an unsigned integer: ") + key);
  return s;
}

inline int64_t int64_field(const json &args, const char *key) {
  std::string s = uint_field(args, key);
  boost::multiprecision::cpp_int v(s);
  if (v > INT64_MAX)
    throw DecodeError(std::string("event argument exceeds int64: ") + key);
  return static_cast<int64_t>(v);
}

// wei -> "整数.18位小数"
inline std::string wei_to_decimal(const std::string &wei) {
  std::string digits = wei;
  size_t nz = digits.find_first_not_of('0');
  digits = nz == std::string::npos ? "0" : digits.substr(nz);

  if (digits.size() <= static_cast<size_t>(WEI_DECIMALS)) {
    digits.insert(0, static_cast<size_t>(WEI_DECIMALS) + 1 - digits.size(), '0');
  }
  std::string integer = digits.substr(0, digits.size() - WEI_DECIMALS);
  std::string fraction = digits.substr(digits.size() - WEI_DECIMALS);
  if (integer.size() > MAX_INTEGER_DIGITS)
    throw DecodeError("amount out of range: " + wei);
  return integer + "." + fraction;
}

} // namespace payload

inline EventPayload decode_payload(EventKind kind, const json &args) {
  switch (kind) {
  case EventKind::GrantCreated: {
    GrantCreated ev;
    ev.grant_id = payload::int64_field(args, "id");
    ev.owner = payload::address_field(args, "owner");
    ev.metadata = payload::string_field(args, "metadata");
    return ev;
  }
  case EventKind::DonationReceived: {
    DonationReceived ev;
    ev.donor = payload::address_field(args, "donor");
    ev.token = payload::address_field(args, "token");
    ev.amount_wei = payload::uint_field(args, "amount");
    ev.amount_eth = payload::wei_to_decimal(ev.amount_wei);
    ev.round_id = payload::int64_field(args, "roundId");
    ev.grant_id = payload::int64_field(args, "grantId");
    return ev;
  }
  }
  throw DecodeError("unknown event kind");
}
