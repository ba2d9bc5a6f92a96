#pragma once

#include <duckdb.hpp>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

#include "errors.hpp"

using json = nlohmann::json;

// 一个进程一个 DuckDB 实例; 每条管线 (tail / backfill / 测试线程) 用 connect() 拿自己的连接
// DuckDB 只允许一个写进程, 第二个进程打开同一文件会失败
class Database {
public:
  explicit Database(const std::string &path) : db_path_(path) {
    try {
      db_ = std::make_unique<duckdb::DuckDB>(path);
      admin_conn_ = std::make_unique<duckdb::Connection>(*db_);
    } catch (const std::exception &e) {
      throw PersistenceError("cannot open database " + path + ": " + e.what());
    }
  }

  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;

  const std::string &path() const { return db_path_; }

  std::unique_ptr<duckdb::Connection> connect() { return std::make_unique<duckdb::Connection>(*db_); }

  void execute(const std::string &sql) {
    std::lock_guard<std::mutex> lock(admin_mutex_);
    auto result = admin_conn_->Query(sql);
    if (result->HasError())
      throw PersistenceError("execute failed: " + result->GetError());
  }

  json query_json(const std::string &sql) {
    std::lock_guard<std::mutex> lock(admin_mutex_);
    return to_json(*admin_conn_, sql);
  }

  int64_t query_single_int(const std::string &sql) {
    std::lock_guard<std::mutex> lock(admin_mutex_);
    auto result = admin_conn_->Query(sql);
    if (result->HasError())
      throw PersistenceError("query failed: " + result->GetError());
    if (result->RowCount() == 0)
      return 0;
    auto val = result->GetValue(0, 0);
    return val.IsNull() ? 0 : val.GetValue<int64_t>();
  }

  int64_t get_table_count(const std::string &table) {
    return query_single_int("SELECT COUNT(*) FROM " + table);
  }

  // 结果集 -> json 数组, DECIMAL/UUID/TIMESTAMP 用文本
  static json to_json(duckdb::Connection &conn, const std::string &sql) {
    auto result = conn.Query(sql);
    if (result->HasError())
      throw PersistenceError("query failed: " + result->GetError());

    json rows = json::array();
    auto &types = result->types;
    auto names = result->names;

    for (size_t row = 0; row < result->RowCount(); ++row) {
      json obj = json::object();
      for (size_t col = 0; col < result->ColumnCount(); ++col) {
        auto value = result->GetValue(col, row);
        if (value.IsNull()) {
          obj[names[col]] = nullptr;
        } else {
          switch (types[col].id()) {
          case duckdb::LogicalTypeId::BOOLEAN:
            obj[names[col]] = value.GetValue<bool>();
            break;
          case duckdb::LogicalTypeId::INTEGER:
            obj[names[col]] = value.GetValue<int32_t>();
            break;
          case duckdb::LogicalTypeId::BIGINT:
            obj[names[col]] = value.GetValue<int64_t>();
            break;
          default:
            obj[names[col]] = value.ToString();
            break;
          }
        }
      }
      rows.push_back(std::move(obj));
    }
    return rows;
  }

  void init_schema() {
    // 链会话: 同一地址 + 不同部署区块哈希 = 不同会话
    execute(R"(
      CREATE TABLE IF NOT EXISTS chain_sessions (
        session_id UUID PRIMARY KEY,
        contract_address VARCHAR NOT NULL,
        deployment_block BIGINT NOT NULL,
        deployment_block_hash VARCHAR NOT NULL,
        created_at TIMESTAMP NOT NULL DEFAULT current_timestamp,
        is_active BOOLEAN NOT NULL DEFAULT true,
        UNIQUE (contract_address, deployment_block_hash)
      )
    )");

    // 原始事件, 主键即幂等键
    execute(R"(
      CREATE TABLE IF NOT EXISTS contract_events (
        tx_hash VARCHAR NOT NULL,
        log_index BIGINT NOT NULL,
        session_id UUID NOT NULL,
        event_type VARCHAR NOT NULL,
        block_number BIGINT NOT NULL,
        block_timestamp BIGINT,
        decoded_args VARCHAR NOT NULL,
        proposal_on_chain_id BIGINT,
        observed_at TIMESTAMP NOT NULL DEFAULT current_timestamp,
        PRIMARY KEY (tx_hash, log_index, session_id)
      )
    )");

    execute(R"(
      CREATE TABLE IF NOT EXISTS donors (
        address VARCHAR PRIMARY KEY,
        donor_id UUID NOT NULL UNIQUE,
        username VARCHAR NOT NULL,
        joined_at TIMESTAMP NOT NULL DEFAULT current_timestamp
      )
    )");

    execute(R"(
      CREATE TABLE IF NOT EXISTS matching_pools (
        pool_id UUID PRIMARY KEY,
        total_funds DECIMAL(38, 18) NOT NULL DEFAULT 0,
        allocated_funds DECIMAL(38, 18) NOT NULL DEFAULT 0,
        replenished_by VARCHAR,
        created_at TIMESTAMP NOT NULL DEFAULT current_timestamp
      )
    )");

    // 轮次是全局的, 不按会话划分
    execute(R"(
      CREATE TABLE IF NOT EXISTS rounds (
        round_id UUID PRIMARY KEY,
        pool_id UUID NOT NULL,
        start_date TIMESTAMP NOT NULL,
        end_date TIMESTAMP NOT NULL,
        status VARCHAR NOT NULL,
        created_at TIMESTAMP NOT NULL DEFAULT current_timestamp
      )
    )");

    execute(R"(
      CREATE TABLE IF NOT EXISTS proposals (
        proposal_id UUID PRIMARY KEY,
        on_chain_id BIGINT NOT NULL,
        session_id UUID NOT NULL,
        proposer_address VARCHAR NOT NULL,
        round_id UUID,
        title VARCHAR NOT NULL,
        description VARCHAR NOT NULL,
        status VARCHAR NOT NULL,
        funding_goal DECIMAL(38, 18) NOT NULL DEFAULT 0,
        total_donations DECIMAL(38, 18) NOT NULL DEFAULT 0,
        created_at TIMESTAMP NOT NULL DEFAULT current_timestamp,
        updated_at TIMESTAMP NOT NULL DEFAULT current_timestamp,
        UNIQUE (on_chain_id, session_id)
      )
    )");

    execute(R"(
      CREATE TABLE IF NOT EXISTS donations (
        donation_id UUID PRIMARY KEY,
        session_id UUID NOT NULL,
        proposal_id UUID NOT NULL,
        on_chain_grant_id BIGINT NOT NULL,
        donor_address VARCHAR NOT NULL,
        token_address VARCHAR NOT NULL,
        round_on_chain_id BIGINT NOT NULL,
        amount DECIMAL(38, 18) NOT NULL,
        description VARCHAR NOT NULL,
        tx_hash VARCHAR NOT NULL,
        log_index BIGINT NOT NULL,
        created_at TIMESTAMP NOT NULL DEFAULT current_timestamp,
        UNIQUE (tx_hash, log_index, session_id)
      )
    )");

    execute(R"(
      CREATE TABLE IF NOT EXISTS sync_cursor (
        session_id UUID PRIMARY KEY,
        last_block BIGINT NOT NULL,
        updated_at TIMESTAMP NOT NULL DEFAULT current_timestamp
      )
    )");

    execute("CREATE INDEX IF NOT EXISTS idx_contract_events_block ON contract_events(session_id, block_number)");
    execute("CREATE INDEX IF NOT EXISTS idx_donations_proposal ON donations(proposal_id)");
    execute("CREATE INDEX IF NOT EXISTS idx_rounds_status ON rounds(status)");
  }

private:
  std::string db_path_;
  std::unique_ptr<duckdb::DuckDB> db_;
  std::unique_ptr<duckdb::Connection> admin_conn_;
  std::mutex admin_mutex_;
};
