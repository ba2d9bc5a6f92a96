#pragma once

// ============================================================================
// 存储层: 一个 Store 持有一条 DuckDB 连接, 不跨线程共享
// SQL 用字符串拼接, 文本值统一经过 quote()
// ============================================================================

#include <duckdb.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>

#include "database.hpp"
#include "errors.hpp"

using json = nlohmann::json;

inline std::string new_uuid() {
  thread_local boost::uuids::random_generator gen;
  return boost::uuids::to_string(gen());
}

inline std::string quote(const std::string &s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'')
      out += "''";
    else
      out += c;
  }
  return out + "'";
}

struct ChainSession {
  std::string session_id;
  std::string contract_address;
  int64_t deployment_block = 0;
  std::string deployment_block_hash;
  bool is_active = true;
};

struct RawEvent {
  std::string tx_hash;
  int64_t log_index = 0;
  std::string session_id;
  std::string event_type;
  int64_t block_number = 0;
  std::optional<int64_t> block_timestamp;
  json decoded_args = json::object();
  std::optional<int64_t> proposal_on_chain_id;
};

struct ProposalRow {
  std::string proposal_id;
  int64_t on_chain_id = 0;
  std::string session_id;
  std::string proposer_address;
  std::string round_id;
  std::string title;
  std::string description;
  std::string status = "pending";
  std::string funding_goal = "0";
  std::string total_donations = "0";
};

struct RoundRow {
  std::string round_id;
  std::string pool_id;
  int64_t start_epoch = 0;
  int64_t end_epoch = 0;
  std::string status = "active";
};

struct DonationRow {
  std::string donation_id;
  std::string session_id;
  std::string proposal_id;
  int64_t on_chain_grant_id = 0;
  std::string donor_address;
  std::string token_address;
  int64_t round_on_chain_id = 0;
  std::string amount; // DECIMAL(38,18) 文本
  std::string description;
  std::string tx_hash;
  int64_t log_index = 0;
};

class Store {
public:
  explicit Store(Database &db) : conn_(db.connect()) {}

  Store(const Store &) = delete;
  Store &operator=(const Store &) = delete;

  // RAII 事务, 未 commit 的在析构时回滚
  class Transaction {
  public:
    explicit Transaction(Store &store) : store_(store) { store_.run("BEGIN TRANSACTION", "begin"); }

    ~Transaction() {
      if (done_)
        return;
      auto r = store_.conn_->Query("ROLLBACK");
      if (r->HasError())
        std::cerr << "[Store] rollback failed: " << r->GetError() << std::endl;
    }

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    // DuckDB 提交失败时自己回滚
    void commit() {
      done_ = true;
      store_.run("COMMIT", "commit");
    }

  private:
    Store &store_;
    bool done_ = false;
  };

  // ------------------------------------------------------------------------
  // chain_sessions
  // ------------------------------------------------------------------------

  std::optional<ChainSession> find_session(const std::string &address, const std::string &block_hash) {
    auto rows = query_json("SELECT session_id, contract_address, deployment_block, deployment_block_hash, is_active "
                           "FROM chain_sessions WHERE contract_address = " +
                           quote(address) + " AND deployment_block_hash = " + quote(block_hash));
    if (rows.empty())
      return std::nullopt;

    const auto &r = rows[0];
    ChainSession s;
    s.session_id = r["session_id"].get<std::string>();
    s.contract_address = r["contract_address"].get<std::string>();
    s.deployment_block = r["deployment_block"].get<int64_t>();
    s.deployment_block_hash = r["deployment_block_hash"].get<std::string>();
    s.is_active = r["is_active"].get<bool>();
    return s;
  }

  // 唯一键冲突时不插入, 返回是否插入成功
  bool insert_session(const ChainSession &s) {
    auto result = run("INSERT INTO chain_sessions (session_id, contract_address, deployment_block, "
                      "deployment_block_hash, is_active) VALUES (" +
                          quote(s.session_id) + ", " + quote(s.contract_address) + ", " +
                          std::to_string(s.deployment_block) + ", " + quote(s.deployment_block_hash) +
                          ", true) ON CONFLICT DO NOTHING",
                      "insert session");
    return changed_rows(*result) > 0;
  }

  void deactivate_other_sessions(const std::string &session_id) {
    run("UPDATE chain_sessions SET is_active = false WHERE is_active AND session_id <> " + quote(session_id),
        "deactivate sessions");
  }

  // ------------------------------------------------------------------------
  // sync_cursor
  // ------------------------------------------------------------------------

  std::optional<int64_t> get_cursor(const std::string &session_id) {
    auto rows = query_json("SELECT last_block FROM sync_cursor WHERE session_id = " + quote(session_id));
    if (rows.empty() || rows[0]["last_block"].is_null())
      return std::nullopt;
    return rows[0]["last_block"].get<int64_t>();
  }

  void set_cursor(const std::string &session_id, int64_t block) {
    run("INSERT OR REPLACE INTO sync_cursor (session_id, last_block, updated_at) VALUES (" + quote(session_id) +
            ", " + std::to_string(block) + ", current_timestamp)",
        "set cursor");
  }

  // ------------------------------------------------------------------------
  // contract_events
  // ------------------------------------------------------------------------

  bool raw_event_exists(const std::string &tx_hash, int64_t log_index, const std::string &session_id) {
    auto rows = query_json("SELECT 1 AS hit FROM contract_events WHERE tx_hash = " + quote(tx_hash) +
                           " AND log_index = " + std::to_string(log_index) + " AND session_id = " +
                           quote(session_id));
    return !rows.empty();
  }

  // 主键冲突抛 DuplicateKeyError; 非法 UTF-8 以 U+FFFD 落库
  void insert_raw_event(const RawEvent &ev) {
    std::string ts = ev.block_timestamp ? std::to_string(*ev.block_timestamp) : "NULL";
    std::string pid = ev.proposal_on_chain_id ? std::to_string(*ev.proposal_on_chain_id) : "NULL";
    run("INSERT INTO contract_events (tx_hash, log_index, session_id, event_type, block_number, "
        "block_timestamp, decoded_args, proposal_on_chain_id) VALUES (" +
            quote(ev.tx_hash) + ", " + std::to_string(ev.log_index) + ", " + quote(ev.session_id) + ", " +
            quote(ev.event_type) + ", " + std::to_string(ev.block_number) + ", " + ts + ", " +
            quote(ev.decoded_args.dump(-1, ' ', false, json::error_handler_t::replace)) + ", " + pid + ")",
        "insert contract_event");
  }

  // ------------------------------------------------------------------------
  // 投影表
  // ------------------------------------------------------------------------

  std::optional<ProposalRow> find_proposal(int64_t on_chain_id, const std::string &session_id) {
    auto rows = query_json(
        "SELECT proposal_id, on_chain_id, session_id, proposer_address, round_id, title, description, status, "
        "CAST(funding_goal AS VARCHAR) AS funding_goal, CAST(total_donations AS VARCHAR) AS total_donations "
        "FROM proposals WHERE on_chain_id = " +
        std::to_string(on_chain_id) + " AND session_id = " + quote(session_id));
    if (rows.empty())
      return std::nullopt;

    const auto &r = rows[0];
    ProposalRow p;
    p.proposal_id = r["proposal_id"].get<std::string>();
    p.on_chain_id = r["on_chain_id"].get<int64_t>();
    p.session_id = r["session_id"].get<std::string>();
    p.proposer_address = r["proposer_address"].get<std::string>();
    p.round_id = r["round_id"].is_null() ? "" : r["round_id"].get<std::string>();
    p.title = r["title"].get<std::string>();
    p.description = r["description"].get<std::string>();
    p.status = r["status"].get<std::string>();
    p.funding_goal = r["funding_goal"].get<std::string>();
    p.total_donations = r["total_donations"].get<std::string>();
    return p;
  }

  std::optional<RoundRow> find_active_round() {
    auto rows = query_json("SELECT round_id, pool_id, status FROM rounds WHERE status = 'active' "
                           "ORDER BY created_at, round_id LIMIT 1");
    if (rows.empty())
      return std::nullopt;
    RoundRow r;
    r.round_id = rows[0]["round_id"].get<std::string>();
    r.pool_id = rows[0]["pool_id"].get<std::string>();
    r.status = rows[0]["status"].get<std::string>();
    return r;
  }

  // 新资金池 + 新轮次
  void open_round(const RoundRow &round) {
    run("INSERT INTO matching_pools (pool_id, total_funds, allocated_funds) VALUES (" + quote(round.pool_id) +
            ", 0, 0)",
        "insert matching_pool");
    run("INSERT INTO rounds (round_id, pool_id, start_date, end_date, status) VALUES (" + quote(round.round_id) +
            ", " + quote(round.pool_id) + ", epoch_ms(" + std::to_string(round.start_epoch * 1000) +
            "), epoch_ms(" + std::to_string(round.end_epoch * 1000) + "), " + quote(round.status) + ")",
        "insert round");
  }

  void ensure_donor(const std::string &address, const std::string &donor_id, const std::string &username) {
    run("INSERT INTO donors (address, donor_id, username) VALUES (" + quote(address) + ", " + quote(donor_id) +
            ", " + quote(username) + ") ON CONFLICT (address) DO NOTHING",
        "ensure donor");
  }

  // (on_chain_id, session_id) 已存在时更新元数据, total_donations 保持不变
  void upsert_proposal(const ProposalRow &p) {
    std::string round = p.round_id.empty() ? "NULL" : quote(p.round_id);
    run("INSERT INTO proposals (proposal_id, on_chain_id, session_id, proposer_address, round_id, title, "
        "description, status, funding_goal, total_donations) VALUES (" +
            quote(p.proposal_id) + ", " + std::to_string(p.on_chain_id) + ", " + quote(p.session_id) + ", " +
            quote(p.proposer_address) + ", " + round + ", " + quote(p.title) + ", " + quote(p.description) +
            ", " + quote(p.status) + ", CAST(" + quote(p.funding_goal) + " AS DECIMAL(38, 18)), 0) "
            "ON CONFLICT (on_chain_id, session_id) DO UPDATE SET "
            "proposer_address = excluded.proposer_address, round_id = excluded.round_id, "
            "title = excluded.title, description = excluded.description, status = excluded.status, "
            "funding_goal = excluded.funding_goal, updated_at = current_timestamp",
        "upsert proposal");
  }

  void insert_donation(const DonationRow &d) {
    run("INSERT INTO donations (donation_id, session_id, proposal_id, on_chain_grant_id, donor_address, "
        "token_address, round_on_chain_id, amount, description, tx_hash, log_index) VALUES (" +
            quote(d.donation_id) + ", " + quote(d.session_id) + ", " + quote(d.proposal_id) + ", " +
            std::to_string(d.on_chain_grant_id) + ", " + quote(d.donor_address) + ", " + quote(d.token_address) +
            ", " + std::to_string(d.round_on_chain_id) + ", CAST(" + quote(d.amount) + " AS DECIMAL(38, 18)), " +
            quote(d.description) + ", " + quote(d.tx_hash) + ", " + std::to_string(d.log_index) + ")",
        "insert donation");
  }

  void add_to_proposal_total(const std::string &proposal_id, const std::string &amount) {
    run("UPDATE proposals SET total_donations = total_donations + CAST(" + quote(amount) +
            " AS DECIMAL(38, 18)), updated_at = current_timestamp WHERE proposal_id = " + quote(proposal_id),
        "update proposal total");
  }

  // ------------------------------------------------------------------------
  // 查询
  // ------------------------------------------------------------------------

  json query_json(const std::string &sql) { return Database::to_json(*conn_, sql); }

  int64_t count(const std::string &table, const std::string &where = "") {
    auto rows = query_json("SELECT COUNT(*) AS cnt FROM " + table + (where.empty() ? "" : " WHERE " + where));
    return rows.empty() ? 0 : rows[0]["cnt"].get<int64_t>();
  }

private:
  static int64_t changed_rows(duckdb::MaterializedQueryResult &result) {
    if (result.RowCount() == 0 || result.ColumnCount() == 0)
      return 0;
    auto v = result.GetValue(0, 0);
    return v.IsNull() ? 0 : v.GetValue<int64_t>();
  }

  // 唯一约束冲突 (语句执行时或提交时) 归为 DuplicateKeyError
  std::unique_ptr<duckdb::MaterializedQueryResult> run(const std::string &sql, const std::string &what) {
    auto result = conn_->Query(sql);
    if (!result->HasError())
      return result;

    const std::string &msg = result->GetError();
    if (result->GetErrorType() == duckdb::ExceptionType::CONSTRAINT ||
        msg.find("Duplicate key") != std::string::npos || msg.find("duplicate key") != std::string::npos) {
      throw DuplicateKeyError(what + ": " + msg);
    }
    throw PersistenceError(what + ": " + msg);
  }

  std::unique_ptr<duckdb::Connection> conn_;
};
