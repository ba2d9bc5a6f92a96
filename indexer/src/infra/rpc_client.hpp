#pragma once

#include <chrono>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

#include "../core/errors.hpp"
#include "../core/events.hpp"
#include "abi.hpp"
#include "chain_reader.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;
using json = nlohmann::json;

// eth_getLogs 返回的一条原始日志 -> EventLog
// topic0 不匹配: kind 为空, args 保留原始 topics/data
// ABI 解码失败: 写入 decode_error, 不抛出
inline EventLog parse_log(const WatchedEvent &watched, const json &raw) {
  EventLog log;
  try {
    log.tx_hash = abi::to_lower(raw.at("transactionHash").get<std::string>());
    log.log_index = abi::hex_to_int64(raw.at("logIndex").get<std::string>());
    log.block_number = abi::hex_to_int64(raw.at("blockNumber").get<std::string>());
    log.address = abi::to_lower(raw.value("address", watched.address));
  } catch (const json::exception &e) {
    throw RpcError("malformed log entry: " + std::string(e.what()));
  } catch (const DecodeError &e) {
    throw RpcError("malformed log entry: " + std::string(e.what()));
  }
  log.contract = watched.contract;

  std::vector<std::string> topics;
  for (const auto &t : raw.value("topics", json::array())) {
    if (t.is_string())
      topics.push_back(abi::to_lower(t.get<std::string>()));
  }
  std::string data = raw.value("data", "0x");

  if (topics.empty() || topics[0] != watched.topic0) {
    log.event_name = "Unknown";
    log.args = {{"topics", topics}, {"data", data}};
    return log;
  }

  log.event_name = watched.abi.name;
  log.kind = watched.kind;
  try {
    log.args = abi::decode_log(watched.abi, topics, data);
  } catch (const DecodeError &e) {
    log.decode_error = e.what();
    log.args = {{"topics", topics}, {"data", data}};
  }
  return log;
}

class RpcClient : public ChainReader {
public:
  RpcClient(const std::string &url, const std::string &api_key = "", int timeout_seconds = 30,
            bool log_calls = false)
      : api_key_(api_key), timeout_(timeout_seconds), log_calls_(log_calls) {
    parse_url(url);
  }

  int64_t block_number() override {
    json result = call("eth_blockNumber", json::array());
    return quantity(result, "eth_blockNumber");
  }

  std::string get_code(const std::string &address, int64_t block) override {
    json result = call("eth_getCode", json::array({address, abi::int64_to_hex(block)}));
    if (!result.is_string())
      throw RpcError("eth_getCode: unexpected result " + result.dump());
    return result.get<std::string>();
  }

  BlockHeader get_block(int64_t block) override {
    json result = call("eth_getBlockByNumber", json::array({abi::int64_to_hex(block), false}));
    if (!result.is_object())
      throw RpcError("eth_getBlockByNumber: block " + std::to_string(block) + " not found");

    BlockHeader header;
    header.number = block;
    header.hash = abi::to_lower(result.value("hash", ""));
    if (header.hash.empty())
      throw RpcError("eth_getBlockByNumber: block " + std::to_string(block) + " has no hash");
    header.timestamp = quantity(result.value("timestamp", json()), "eth_getBlockByNumber");
    return header;
  }

  std::vector<EventLog> get_event_logs(const WatchedEvent &watched, int64_t from_block,
                                       int64_t to_block) override {
    json filter = {
        {"address", watched.address},
        {"fromBlock", abi::int64_to_hex(from_block)},
        {"toBlock", abi::int64_to_hex(to_block)},
        {"topics", json::array({watched.topic0})}};

    json result = call("eth_getLogs", json::array({filter}));
    if (!result.is_array())
      throw RpcError("eth_getLogs: unexpected result " + result.dump());

    std::vector<EventLog> logs;
    logs.reserve(result.size());
    for (const auto &raw : result) {
      if (raw.value("removed", false))
        continue;
      logs.push_back(parse_log(watched, raw));
    }
    sort_logs(logs);
    return logs;
  }

private:
  json call(const std::string &method, const json &params) {
    json request = {
        {"jsonrpc", "2.0"},
        {"id", ++request_id_},
        {"method", method},
        {"params", params}};

    auto start = std::chrono::steady_clock::now();
    std::string response_body = http_post(request.dump());
    if (log_calls_) {
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start)
                    .count();
      std::cout << "[RPC] method=" << method << " duration_ms=" << ms
                << " bytes=" << response_body.size() << std::endl;
    }

    json response;
    try {
      response = json::parse(response_body);
    } catch (const json::parse_error &e) {
      throw RpcError(method + ": response is not JSON: " + e.what());
    }
    if (!response.is_object())
      throw RpcError(method + ": response is not an object");
    if (response.contains("error")) {
      throw RpcError(method + ": RPC error: " + response["error"].dump());
    }
    if (!response.contains("result"))
      throw RpcError(method + ": response without result");
    return response["result"];
  }

  static int64_t quantity(const json &value, const std::string &method) {
    if (!value.is_string())
      throw RpcError(method + ": expected hex quantity, got " + value.dump());
    try {
      return abi::hex_to_int64(value.get<std::string>());
    } catch (const DecodeError &e) {
      throw RpcError(method + ": " + e.what());
    }
  }

  void parse_url(const std::string &url) {
    std::string u = url;

    if (u.starts_with("https://")) {
      use_ssl_ = true;
      u = u.substr(8);
    } else if (u.starts_with("http://")) {
      use_ssl_ = false;
      u = u.substr(7);
    } else {
      throw ConfigError("RPC URL must start with http:// or https://: " + url);
    }

    auto slash_pos = u.find('/');
    if (slash_pos != std::string::npos) {
      target_ = u.substr(slash_pos);
      u = u.substr(0, slash_pos);
    } else {
      target_ = "/";
    }

    auto colon_pos = u.find(':');
    if (colon_pos != std::string::npos) {
      host_ = u.substr(0, colon_pos);
      port_ = u.substr(colon_pos + 1);
    } else {
      host_ = u;
      port_ = use_ssl_ ? "443" : "80";
    }
    if (host_.empty())
      throw ConfigError("RPC URL has no host: " + url);
  }

  // 每一步异步操作都在本地 io_context 上跑完, tcp_stream 的超时才生效
  static void run(asio::io_context &ioc, const beast::error_code &ec, const char *step) {
    ioc.run();
    ioc.restart();
    if (ec)
      throw RpcError(std::string(step) + " failed: " + ec.message());
  }

  template <class Stream>
  std::string exchange(asio::io_context &ioc, Stream &stream, beast::tcp_stream &lowest,
                       http::request<http::string_body> &req) {
    beast::error_code ec;
    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(256 * 1024 * 1024);

    lowest.expires_after(timeout_);
    http::async_write(stream, req, [&](beast::error_code e, size_t) { ec = e; });
    run(ioc, ec, "write");

    lowest.expires_after(timeout_);
    http::async_read(stream, buffer, parser, [&](beast::error_code e, size_t) { ec = e; });
    run(ioc, ec, "read");

    auto status = parser.get().result_int();
    if (status != 200)
      throw RpcError("HTTP status " + std::to_string(status) + " from " + host_);
    return parser.get().body();
  }

  std::string http_post(const std::string &body) {
    asio::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::error_code ec;

    http::request<http::string_body> req{http::verb::post, target_, 11};
    req.set(http::field::host, host_);
    req.set(http::field::content_type, "application/json");
    req.set(http::field::user_agent, "GrantIndexer/1.0");

    if (!api_key_.empty()) {
      req.set(http::field::authorization, "Bearer " + api_key_);
    }

    req.body() = body;
    req.prepare_payload();

    tcp::resolver::results_type endpoints;
    resolver.async_resolve(host_, port_, [&](beast::error_code e, tcp::resolver::results_type r) {
      ec = e;
      endpoints = std::move(r);
    });
    run(ioc, ec, "resolve");

    std::string result;
    if (use_ssl_) {
      asio::ssl::context ssl_ctx(asio::ssl::context::tls_client);
      ssl_ctx.set_default_verify_paths();
      ssl_ctx.set_verify_mode(asio::ssl::verify_peer);
      beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_ctx);
      if (!SSL_set_tlsext_host_name(stream.native_handle(), host_.c_str()))
        throw RpcError("cannot set SNI host name " + host_);

      auto &lowest = beast::get_lowest_layer(stream);
      lowest.expires_after(timeout_);
      lowest.async_connect(endpoints, [&](beast::error_code e, const tcp::endpoint &) { ec = e; });
      run(ioc, ec, "connect");

      lowest.expires_after(timeout_);
      stream.async_handshake(asio::ssl::stream_base::client, [&](beast::error_code e) { ec = e; });
      run(ioc, ec, "TLS handshake");

      result = exchange(ioc, stream, lowest, req);

      // 很多节点不回 close_notify, shutdown 的错误忽略
      lowest.expires_after(timeout_);
      stream.async_shutdown([](beast::error_code) {});
      ioc.run();
    } else {
      beast::tcp_stream stream(ioc);
      stream.expires_after(timeout_);
      stream.async_connect(endpoints, [&](beast::error_code e, const tcp::endpoint &) { ec = e; });
      run(ioc, ec, "connect");

      result = exchange(ioc, stream, stream, req);

      beast::error_code ignored;
      stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
    }

    return result;
  }

  std::string host_;
  std::string port_;
  std::string target_;
  std::string api_key_;
  std::chrono::seconds timeout_;
  bool log_calls_ = false;
  bool use_ssl_ = false;
  int request_id_ = 0;
};
