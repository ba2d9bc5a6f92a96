#pragma once

// ============================================================================
// 指标 HTTP 服务: GET /metrics (Prometheus), GET /health (json)
// ============================================================================

#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <nlohmann/json.hpp>

#include "metrics.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;
using json = nlohmann::json;

using HealthGetter = std::function<json()>;

// ============================================================================
// Metrics Session
// ============================================================================
class MetricsSession : public std::enable_shared_from_this<MetricsSession> {
public:
  MetricsSession(tcp::socket socket, const Metrics &metrics, const HealthGetter &health)
      : socket_(std::move(socket)), metrics_(metrics), health_(health) {}

  void run() { do_read(); }

private:
  void do_read() {
    req_ = {};
    http::async_read(socket_, buffer_, req_, [self = shared_from_this()](beast::error_code ec, std::size_t) {
      if (ec)
        return;
      self->handle_request();
    });
  }

  void handle_request() {
    res_ = {};
    res_.version(req_.version());
    res_.keep_alive(false);

    std::string target(req_.target());

    if (req_.method() != http::verb::get) {
      res_.result(http::status::method_not_allowed);
      res_.set(http::field::content_type, "application/json");
      res_.body() = R"({"error":"Method not allowed"})";
    } else if (target == "/metrics") {
      res_.result(http::status::ok);
      res_.set(http::field::content_type, "text/plain; version=0.0.4");
      res_.body() = metrics_.render_prometheus();
    } else if (target == "/health") {
      json body = health_ ? health_() : json::object();
      body["status"] = "ok";
      res_.result(http::status::ok);
      res_.set(http::field::content_type, "application/json");
      res_.body() = body.dump();
    } else {
      res_.result(http::status::not_found);
      res_.set(http::field::content_type, "application/json");
      res_.body() = R"({"error":"Not found"})";
    }

    res_.prepare_payload();
    do_write();
  }

  void do_write() {
    http::async_write(socket_, res_, [self = shared_from_this()](beast::error_code ec, std::size_t) {
      self->socket_.shutdown(tcp::socket::shutdown_send, ec);
    });
  }

  tcp::socket socket_;
  const Metrics &metrics_;
  const HealthGetter &health_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  http::response<http::string_body> res_;
};

// ============================================================================
// Metrics Server
// ============================================================================
class MetricsServer {
public:
  MetricsServer(asio::io_context &ioc, const Metrics &metrics, unsigned short port, HealthGetter health = {})
      : acceptor_(ioc, tcp::endpoint(tcp::v4(), port)), metrics_(metrics), health_(std::move(health)) {
    std::cout << "[Metrics] listening on port " << port << std::endl;
    do_accept();
  }

private:
  void do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
      if (ec == asio::error::operation_aborted)
        return;
      if (!ec) {
        std::make_shared<MetricsSession>(std::move(socket), metrics_, health_)->run();
      }
      do_accept();
    });
  }

  tcp::acceptor acceptor_;
  const Metrics &metrics_;
  HealthGetter health_;
};

// 独立线程上运行的指标服务, 析构时停止并 join
class MetricsEndpoint {
public:
  MetricsEndpoint(const Metrics &metrics, unsigned short port, HealthGetter health)
      : server_(ioc_, metrics, port, std::move(health)), thread_([this]() { ioc_.run(); }) {}

  ~MetricsEndpoint() {
    ioc_.stop();
    if (thread_.joinable())
      thread_.join();
  }

  MetricsEndpoint(const MetricsEndpoint &) = delete;
  MetricsEndpoint &operator=(const MetricsEndpoint &) = delete;

private:
  asio::io_context ioc_;
  MetricsServer server_;
  std::thread thread_;
};
