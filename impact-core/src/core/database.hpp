#pragma once

#include <cerrno>
#include <cstring>
#include <duckdb.hpp>
#include <fcntl.h>
#include <iostream>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <sys/file.h>
#include <unistd.h>
#include <vector>

#include "../ledger/event_store.hpp"

using json = nlohmann::json;

// ============================================================================
// Database - DuckDB 事件日志
// ============================================================================
// event_log: 每个操作的事件在同一事务内写入, 同时更新 journal_state.last_seq
// 进程启动时持有 <db>.lock 的排他 flock, 同一时间只允许一个写入进程
class Database : public ledger::EventStore {
public:
  explicit Database(const std::string &path) : db_path_(path) {
    lock_path_ = path + ".lock";
    lock_fd_ = open(lock_path_.c_str(), O_CREAT | O_RDWR, 0666);
    if (lock_fd_ < 0)
      throw std::runtime_error("无法创建锁文件 " + lock_path_ + ": " + std::strerror(errno));
    if (flock(lock_fd_, LOCK_EX | LOCK_NB) != 0) {
      close(lock_fd_);
      throw std::runtime_error("数据库已被其他进程占用: " + path);
    }

    db_ = std::make_unique<duckdb::DuckDB>(path);
    read_conn_ = std::make_unique<duckdb::Connection>(*db_);
    write_conn_ = std::make_unique<duckdb::Connection>(*db_);
  }

  ~Database() override {
    if (lock_fd_ >= 0) {
      flock(lock_fd_, LOCK_UN);
      close(lock_fd_);
    }
  }

  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;

  void execute(const std::string &sql) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    check(write_conn_->Query(sql), "execute");
  }

  int64_t query_single_int(const std::string &sql) {
    std::lock_guard<std::mutex> lock(read_mutex_);
    auto result = read_conn_->Query(sql);
    check(result, "query_single_int");
    if (result->RowCount() == 0)
      return 0;
    auto val = result->GetValue(0, 0);
    return val.IsNull() ? 0 : val.GetValue<int64_t>();
  }

  void init_schema() {
    execute(R"(
      CREATE TABLE IF NOT EXISTS journal_state (
        key TEXT PRIMARY KEY,
        value TEXT
      )
    )");

    // 事件日志, 也是 indexer 的数据源
    execute(R"(
      CREATE TABLE IF NOT EXISTS event_log (
        seq BIGINT PRIMARY KEY,
        ts BIGINT NOT NULL,
        type TEXT NOT NULL,
        project_id TEXT NOT NULL,
        payload TEXT NOT NULL
      )
    )");

    execute("CREATE INDEX IF NOT EXISTS idx_event_log_project ON event_log(project_id)");
    execute("CREATE INDEX IF NOT EXISTS idx_event_log_type ON event_log(type)");
  }

  int64_t get_last_seq() {
    return query_single_int(
        "SELECT COALESCE(MAX(CAST(value AS BIGINT)), 0) FROM journal_state WHERE key='last_seq'");
  }

  int64_t get_event_count() { return query_single_int("SELECT COUNT(*) FROM event_log"); }

  std::vector<ledger::Event> load_all() override {
    return load("SELECT seq, ts, type, project_id, payload FROM event_log ORDER BY seq");
  }

  std::vector<ledger::Event> load_since(int64_t after_seq, size_t limit) override {
    return load("SELECT seq, ts, type, project_id, payload FROM event_log WHERE seq > " +
                std::to_string(after_seq) + " ORDER BY seq LIMIT " + std::to_string(limit));
  }

  void append(const std::vector<ledger::Event> &events) override {
    if (events.empty())
      return;
    std::lock_guard<std::mutex> lock(write_mutex_);

    check(write_conn_->Query("BEGIN TRANSACTION"), "BEGIN");
    try {
      auto stmt = write_conn_->Prepare(
          "INSERT INTO event_log (seq, ts, type, project_id, payload) VALUES ($1, $2, $3, $4, $5)");
      check(stmt, "prepare insert event_log");

      for (const auto &e : events) {
        duckdb::vector<duckdb::Value> params{
            duckdb::Value::BIGINT(e.seq),
            duckdb::Value::BIGINT(e.ts),
            duckdb::Value(ledger::event_type_name(e.type)),
            duckdb::Value(e.project_id),
            duckdb::Value(e.payload.dump()),
        };
        check(stmt->Execute(params, false), "insert event_log");
      }

      check(write_conn_->Query(
                "INSERT OR REPLACE INTO journal_state (key, value) VALUES ('last_seq', '" +
                std::to_string(events.back().seq) + "')"),
            "update journal_state");
      check(write_conn_->Query("COMMIT"), "COMMIT");
    } catch (const std::exception &e) {
      auto rb = write_conn_->Query("ROLLBACK");
      if (rb->HasError())
        std::cerr << "[DB] ROLLBACK 失败: " << rb->GetError() << std::endl;
      std::cerr << "[DB] 写入事件失败, 已回滚: " << e.what() << std::endl;
      throw;
    }
  }

private:
  template <typename R> static void check(const R &result, const char *what) {
    if (result->HasError())
      throw std::runtime_error(std::string("[DB] ") + what + " failed: " + result->GetError());
  }

  std::vector<ledger::Event> load(const std::string &sql) {
    std::lock_guard<std::mutex> lock(read_mutex_);
    auto result = read_conn_->Query(sql);
    check(result, "load events");

    std::vector<ledger::Event> events;
    events.reserve(result->RowCount());
    for (size_t row = 0; row < result->RowCount(); ++row) {
      ledger::Event e;
      e.seq = result->GetValue(0, row).GetValue<int64_t>();
      e.ts = result->GetValue(1, row).GetValue<int64_t>();
      e.type = ledger::event_type_from_name(result->GetValue(2, row).ToString());
      e.project_id = result->GetValue(3, row).ToString();
      e.payload = json::parse(result->GetValue(4, row).ToString());
      events.push_back(std::move(e));
    }
    return events;
  }

  // 路径
  std::string db_path_;
  std::string lock_path_;
  // 文件锁
  int lock_fd_ = -1;
  // DuckDB
  std::unique_ptr<duckdb::DuckDB> db_;
  std::unique_ptr<duckdb::Connection> read_conn_;
  std::unique_ptr<duckdb::Connection> write_conn_;
  std::mutex read_mutex_;
  std::mutex write_mutex_;
};
