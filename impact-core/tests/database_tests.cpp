// ============================================================================
// Database (DuckDB 事件日志) 测试
// ============================================================================
//
// Tests:
//   1. 追加 / 读取事件, last_seq
//   2. 一批事件中任何一条失败时整批回滚
//   3. 同一路径只能被一个实例打开
//   4. Engine 从磁盘日志重建状态
//
// ============================================================================

#include <boost/test/unit_test.hpp>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <unistd.h>

#include "core/database.hpp"
#include "protocol/types.hpp"
#include "test_fixtures.hpp"

using namespace fixtures;

namespace {

// 每个用例一个独立的临时数据库文件
struct TempDatabaseSetup {
  TempDatabaseSetup() {
    static int counter = 0;
    path = (std::filesystem::temp_directory_path() /
            ("impactbond_test_" + std::to_string(getpid()) + "_" + std::to_string(++counter) +
             ".duckdb"))
               .string();
    cleanup();
  }

  ~TempDatabaseSetup() { cleanup(); }

  void cleanup() {
    std::error_code ec;
    for (const char *suffix : {"", ".wal", ".lock"})
      std::filesystem::remove(path + suffix, ec);
  }

  static ledger::Event make_event(int64_t seq, const std::string &project_id, json payload) {
    ledger::Event e;
    e.seq = seq;
    e.ts = T0 + seq;
    e.type = ledger::EventType::ProjectFunded;
    e.project_id = project_id;
    e.payload = std::move(payload);
    return e;
  }

  std::string path;
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(database_tests, TempDatabaseSetup)

// =============================================================================
// Test 1: 追加 / 读取
// =============================================================================

BOOST_AUTO_TEST_CASE(append_and_load) {
  Database db(path);
  db.init_schema();
  BOOST_CHECK_EQUAL(db.get_last_seq(), 0);
  BOOST_CHECK(db.load_all().empty());

  db.append({make_event(1, "prj-000001", {{"delta", "5"}}),
             make_event(2, "prj-000001", {{"delta", "7"}})});
  db.append({make_event(3, "prj-000002", {{"delta", "1"}})});

  BOOST_CHECK_EQUAL(db.get_last_seq(), 3);
  BOOST_CHECK_EQUAL(db.get_event_count(), 3);

  auto all = db.load_all();
  BOOST_REQUIRE_EQUAL(all.size(), 3u);
  BOOST_CHECK_EQUAL(all[0].seq, 1);
  BOOST_CHECK_EQUAL(all[0].ts, T0 + 1);
  BOOST_CHECK(all[0].type == ledger::EventType::ProjectFunded);
  BOOST_CHECK_EQUAL(all[1].payload.at("delta").get<std::string>(), "7");
  BOOST_CHECK_EQUAL(all[2].project_id, "prj-000002");

  auto page = db.load_since(1, 1);
  BOOST_REQUIRE_EQUAL(page.size(), 1u);
  BOOST_CHECK_EQUAL(page[0].seq, 2);
}

// =============================================================================
// Test 2: 回滚
// =============================================================================

BOOST_AUTO_TEST_CASE(duplicate_seq_rolls_back_whole_batch) {
  Database db(path);
  db.init_schema();
  db.append({make_event(1, "prj-000001", json::object())});

  // seq 2 合法, seq 1 重复 -> 整批失败
  BOOST_CHECK_THROW(db.append({make_event(2, "prj-000001", json::object()),
                               make_event(1, "prj-000001", json::object())}),
                    std::runtime_error);
  BOOST_CHECK_EQUAL(db.get_event_count(), 1);
  BOOST_CHECK_EQUAL(db.get_last_seq(), 1);

  // 连接仍可用
  db.append({make_event(2, "prj-000001", json::object())});
  BOOST_CHECK_EQUAL(db.get_event_count(), 2);
}

// =============================================================================
// Test 3: 独占
// =============================================================================

BOOST_AUTO_TEST_CASE(second_open_is_rejected) {
  Database db(path);
  BOOST_CHECK_THROW(Database second(path), std::runtime_error);
}

// =============================================================================
// Test 4: Engine 重建
// =============================================================================

BOOST_AUTO_TEST_CASE(engine_state_survives_restart) {
  std::string project;
  int64_t head = 0;
  {
    Database db(path);
    db.init_schema();
    protocol::Engine engine(db, default_options());
    engine.credit_collateral(as("admin"), "alice", units::usdc(500));
    project = engine.register_project(as("sponsor"), "Solar", "ipfs://x", units::usdc(500),
                                      units::usdc(5));
    engine.update_status(as("oracle"), project, protocol::ProjectStatus::Funding);
    engine.create_bond(as("sponsor"), project);
    engine.purchase_bonds(as("alice"), project, units::usdc(500));
    head = engine.head_seq();
  }

  Database db(path);
  db.init_schema();
  BOOST_CHECK_EQUAL(db.get_last_seq(), head);
  protocol::Engine engine(db, default_options());
  BOOST_CHECK_EQUAL(engine.head_seq(), head);
  BOOST_CHECK(engine.get_project(project).status == protocol::ProjectStatus::Active);
  BOOST_CHECK_EQUAL(engine.bond_balance(project, "alice"), units::wad(100));
  BOOST_CHECK_EQUAL(engine.collateral_balance("alice"), 0);
  BOOST_CHECK(engine.has_role("oracle", protocol::Role::Oracle));
}

BOOST_AUTO_TEST_SUITE_END()
