#pragma once

// ============================================================================
// Solidity event ABI 解码
// topics: indexed 参数, data: 非 indexed 参数 (head/tail 编码)
// ============================================================================

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>
#include <nlohmann/json.hpp>

#include "../core/errors.hpp"

using json = nlohmann::json;

namespace abi {

using boost::multiprecision::cpp_int;
using boost::multiprecision::uint256_t;

struct Param {
  std::string name;
  std::string type;
  bool indexed = false;
};

struct EventAbi {
  std::string name;
  std::vector<Param> inputs;

  // 规范签名, 例如 GrantCreated(uint256,address,string)
  std::string signature() const {
    std::string sig = name + "(";
    for (size_t i = 0; i < inputs.size(); ++i) {
      if (i > 0)
        sig += ",";
      sig += inputs[i].type;
    }
    return sig + ")";
  }
};

inline std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

inline std::string strip_0x(const std::string &s) {
  if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X'))
    return s.substr(2);
  return s;
}

inline bool is_hex(const std::string &s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

inline int64_t hex_to_int64(const std::string &hex) {
  std::string h = strip_0x(hex);
  if (h.empty() || h.size() > 16 || !is_hex(h))
    throw DecodeError("bad hex quantity: " + hex);
  uint64_t v = std::stoull(h, nullptr, 16);
  if (v > static_cast<uint64_t>(INT64_MAX))
    throw DecodeError("hex quantity out of range: " + hex);
  return static_cast<int64_t>(v);
}

inline std::string int64_to_hex(int64_t value) {
  static const char *digits = "0123456789abcdef";
  if (value == 0)
    return "0x0";
  std::string out;
  auto v = static_cast<uint64_t>(value);
  while (v > 0) {
    out.push_back(digits[v & 0xF]);
    v >>= 4;
  }
  std::reverse(out.begin(), out.end());
  return "0x" + out;
}

// 从 ABI json (数组或 Hardhat artifact) 中找到事件定义
inline EventAbi find_event(const json &abi_json, const std::string &event_name) {
  const json &entries = abi_json.is_object() && abi_json.contains("abi") ? abi_json["abi"] : abi_json;
  if (!entries.is_array())
    throw DecodeError("ABI is not an array");

  for (const auto &entry : entries) {
    if (!entry.is_object() || entry.value("type", "") != "event" || entry.value("name", "") != event_name)
      continue;

    EventAbi ev;
    ev.name = event_name;
    for (const auto &in : entry.value("inputs", json::array())) {
      Param p;
      p.name = in.value("name", "");
      p.type = in.value("type", "");
      p.indexed = in.value("indexed", false);
      if (p.type.empty())
        throw DecodeError("ABI input without type in event " + event_name);
      ev.inputs.push_back(std::move(p));
    }
    return ev;
  }
  throw DecodeError("event not found in ABI: " + event_name);
}

namespace detail {

// 32 字节 word, 64 个 hex 字符
inline std::string word_at(const std::string &data, size_t offset_bytes) {
  size_t start = offset_bytes * 2;
  if (start + 64 > data.size())
    throw DecodeError("ABI data out of bounds at offset " + std::to_string(offset_bytes));
  return data.substr(start, 64);
}

inline uint256_t word_to_uint(const std::string &word) { return uint256_t("0x" + word); }

inline size_t word_to_size(const std::string &word, size_t limit) {
  uint256_t v = word_to_uint(word);
  if (v > limit)
    throw DecodeError("ABI offset/length out of bounds");
  return static_cast<size_t>(v);
}

inline int type_bits(const std::string &type, size_t prefix_len) {
  std::string suffix = type.substr(prefix_len);
  if (suffix.empty())
    return 256;
  if (suffix.size() > 3 || !std::all_of(suffix.begin(), suffix.end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
    throw DecodeError("unsupported ABI type: " + type);
  int bits = std::stoi(suffix);
  if (bits <= 0 || bits > 256 || bits % 8 != 0)
    throw DecodeError("unsupported ABI type: " + type);
  return bits;
}

inline bool is_dynamic(const std::string &type) { return type == "string" || type == "bytes"; }

// 严格 UTF-8: 拒绝过长编码, 代理区, > U+10FFFF
inline bool valid_utf8(const std::string &s) {
  size_t i = 0;
  while (i < s.size()) {
    auto c = static_cast<unsigned char>(s[i]);
    size_t n = 0;
    uint32_t cp = 0;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      n = 1;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      n = 2;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      n = 3;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + n >= s.size())
      return false;
    for (size_t k = 1; k <= n; ++k) {
      auto cc = static_cast<unsigned char>(s[i + k]);
      if ((cc & 0xC0) != 0x80)
        return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    static const uint32_t min_cp[] = {0, 0x80, 0x800, 0x10000};
    if (cp < min_cp[n] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
      return false;
    i += n + 1;
  }
  return true;
}

inline json decode_static(const std::string &type, const std::string &word) {
  if (type == "address") {
    return "0x" + to_lower(word.substr(24));
  }
  if (type == "bool") {
    return word_to_uint(word) != 0;
  }
  if (type.starts_with("uint")) {
    type_bits(type, 4);
    return word_to_uint(word).str();
  }
  if (type.starts_with("int")) {
    type_bits(type, 3);
    // int<N> 已符号扩展到 256 位
    cpp_int v = cpp_int(word_to_uint(word));
    if (v >= (cpp_int(1) << 255))
      v -= cpp_int(1) << 256;
    return v.str();
  }
  if (type.starts_with("bytes") && type != "bytes") {
    // bytes<N> 的 N 是字节数, 1..32
    std::string suffix = type.substr(5);
    if (suffix.size() > 2 || !std::all_of(suffix.begin(), suffix.end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
      throw DecodeError("unsupported ABI type: " + type);
    int n = std::stoi(suffix);
    if (n <= 0 || n > 32)
      throw DecodeError("unsupported ABI type: " + type);
    return "0x" + to_lower(word.substr(0, static_cast<size_t>(n) * 2));
  }
  throw DecodeError("unsupported ABI type: " + type);
}

inline json decode_dynamic(const std::string &type, const std::string &data, size_t offset) {
  size_t total = data.size() / 2;
  size_t len = word_to_size(word_at(data, offset), total);
  size_t start = (offset + 32) * 2;
  if (start + len * 2 > data.size())
    throw DecodeError("ABI dynamic value out of bounds");
  std::string hex = data.substr(start, len * 2);
  if (type == "bytes")
    return "0x" + to_lower(hex);

  std::string out;
  out.reserve(len);
  for (size_t i = 0; i < len; ++i) {
    out.push_back(static_cast<char>(std::stoi(hex.substr(i * 2, 2), nullptr, 16)));
  }
  if (!valid_utf8(out))
    throw DecodeError("ABI string is not valid UTF-8");
  return out;
}

} // namespace detail

// 解码一条日志为 {参数名: 值}, uint/int 用十进制字符串保存
inline json decode_log(const EventAbi &ev, const std::vector<std::string> &topics,
                       const std::string &data_hex) {
  std::string data = strip_0x(data_hex);
  if (data.size() % 2 != 0 || !is_hex(data))
    throw DecodeError("log data is not hex");

  json args = json::object();
  size_t topic_idx = 1; // topics[0] 是事件签名
  size_t head = 0;

  for (size_t i = 0; i < ev.inputs.size(); ++i) {
    const Param &p = ev.inputs[i];
    std::string key = p.name.empty() ? "arg" + std::to_string(i) : p.name;

    if (p.indexed) {
      if (topic_idx >= topics.size())
        throw DecodeError("missing topic for indexed argument " + key);
      std::string topic = strip_0x(topics[topic_idx++]);
      if (topic.size() != 64 || !is_hex(topic))
        throw DecodeError("malformed topic for argument " + key);
      // indexed 的 string/bytes 只保存 keccak 哈希
      args[key] = detail::is_dynamic(p.type) ? json("0x" + to_lower(topic)) : detail::decode_static(p.type, topic);
      continue;
    }

    std::string word = detail::word_at(data, head);
    if (detail::is_dynamic(p.type)) {
      size_t offset = detail::word_to_size(word, data.size() / 2);
      args[key] = detail::decode_dynamic(p.type, data, offset);
    } else {
      args[key] = detail::decode_static(p.type, word);
    }
    head += 32;
  }
  return args;
}

} // namespace abi
