#pragma once

// ============================================================================
// 追块循环: 每 poll_interval 读一次 head, 按 tail_max_range 分段处理
// 一段全部处理完才推进 cursor, 失败时 cursor 停在上一段
// ============================================================================

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <vector>

#include <boost/asio.hpp>

#include "../core/config.hpp"
#include "../core/errors.hpp"
#include "../core/store.hpp"
#include "../infra/chain_reader.hpp"
#include "../obs/metrics.hpp"
#include "event_processor.hpp"
#include "range_fetcher.hpp"

namespace asio = boost::asio;

class TailLoop {
public:
  TailLoop(const Config &config, ChainReader &chain, Store &store, EventProcessor &processor,
           const std::vector<WatchedEvent> &watched, const ChainSession &session, Metrics &metrics)
      : chain_(chain), store_(store), processor_(processor), watched_(watched), session_(session),
        metrics_(metrics), max_range_(config.tail_max_range), interval_seconds_(config.poll_interval_seconds),
        initial_block_(config.initial_block) {}

  // 新会话的起点: initial_block - 1, 默认 deployment_block - 1
  int64_t initial_cursor() const {
    int64_t first = initial_block_ >= 0 ? initial_block_ : session_.deployment_block;
    return first - 1;
  }

  int64_t cursor() {
    auto c = store_.get_cursor(session_.session_id);
    return c ? *c : initial_cursor();
  }

  int64_t get_head_block() const { return head_block_; }

  // 返回 false 表示本轮出错, cursor 停在最后一个完整处理的分段
  bool tick() {
    try {
      int64_t head = chain_.block_number();
      head_block_ = head;
      int64_t cur = cursor();

      if (cur >= head) {
        return true;
      }
      std::cout << "[Tail] head=" << head << " cursor=" << cur << std::endl;

      while (cur < head && !stopped_) {
        int64_t from = cur + 1;
        int64_t to = std::min(cur + max_range_, head);

        auto logs = fetch_ordered(chain_, watched_, from, to);
        OutcomeCounts counts = processor_.process_all(logs);
        store_.set_cursor(session_.session_id, to);
        metrics_.note_block(to);
        cur = to;

        if (counts.total() > 0) {
          std::cout << "[Tail] blocks " << from << ".." << to << " " << counts.to_json().dump() << std::endl;
        }
      }
      return true;
    } catch (const RpcError &e) {
      metrics_.tail_tick_failures_total++;
      std::cerr << "[Tail] RPC failed: " << e.what() << ", retry in " << interval_seconds_ << "s" << std::endl;
    } catch (const PersistenceError &e) {
      metrics_.tail_tick_failures_total++;
      std::cerr << "[Tail] persistence failed: " << e.what() << ", retry in " << interval_seconds_ << "s"
                << std::endl;
    } catch (const std::exception &e) {
      metrics_.tail_tick_failures_total++;
      std::cerr << "[Tail] unexpected error: " << e.what() << ", retry in " << interval_seconds_ << "s" << std::endl;
    }
    return false;
  }

  void start(asio::io_context &ioc) {
    stopped_ = false;
    timer_ = std::make_unique<asio::steady_timer>(ioc);
    std::cout << "[Tail] session=" << session_.session_id << " cursor=" << cursor() << " interval="
              << interval_seconds_ << "s" << std::endl;
    schedule(0);
  }

  void stop() {
    stopped_ = true;
    if (timer_)
      timer_->cancel();
  }

private:
  void schedule(int delay_seconds) {
    timer_->expires_after(std::chrono::seconds(delay_seconds));
    timer_->async_wait([this](boost::system::error_code ec) {
      if (ec || stopped_)
        return;
      tick();
      if (!stopped_)
        schedule(interval_seconds_);
    });
  }

  ChainReader &chain_;
  Store &store_;
  EventProcessor &processor_;
  const std::vector<WatchedEvent> &watched_;
  ChainSession session_;
  Metrics &metrics_;

  int64_t max_range_;
  int interval_seconds_;
  int64_t initial_block_;
  std::unique_ptr<asio::steady_timer> timer_;
  std::atomic<bool> stopped_{false};
  std::atomic<int64_t> head_block_{0};
};
