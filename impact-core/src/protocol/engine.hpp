#pragma once

// ============================================================================
// Engine - 协议核心入口
// ============================================================================
// 写操作流程:
//   1. 独占锁
//   2. 各组件 plan_* 只读校验, 把事件追加到 Batch (失败即抛异常, 无副作用)
//   3. EventStore::append 在一个事务里持久化整批事件
//   4. 按顺序 apply 到内存状态
// 读操作持共享锁, 总是看到某个完整批次之后的状态
// 启动时按 seq 回放事件日志重建状态, 所以市场结算在重启后仍然只发生一次

#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <vector>

#include "../core/amount.hpp"
#include "../core/config.hpp"
#include "../ledger/event_store.hpp"
#include "../ledger/ledger_types.hpp"
#include "access_control.hpp"
#include "bond_ledger.hpp"
#include "collateral_vault.hpp"
#include "market_book.hpp"
#include "oracle_aggregator.hpp"
#include "project_registry.hpp"
#include "types.hpp"
#include "yield_distributor.hpp"

namespace protocol {

struct EngineOptions {
  std::string admin;
  std::vector<std::string> oracles;
  Amount default_liquidity = Amount(1000) * units::WAD;
  YieldPolicy yield_policy = YieldPolicy::RemainingPool;
  OraclePolicy oracle_policy;

  static EngineOptions from_config(const Config &config) {
    EngineOptions o;
    o.admin = config.admin;
    o.oracles = config.oracles;
    o.default_liquidity = Amount(config.default_liquidity) * units::WAD;
    o.yield_policy = yield_policy_from_name(config.yield_policy);
    o.oracle_policy.completion_requires_target_date = config.completion_requires_target_date;
    o.oracle_policy.auto_fail_overdue = config.auto_fail_overdue;
    o.oracle_policy.overdue_grace_seconds = config.overdue_grace_seconds;
    o.oracle_policy.min_milestones = config.min_milestones;
    return o;
  }
};

class Engine {
public:
  using Tx = ledger::Tx;

  Engine(ledger::EventStore &store, EngineOptions options)
      : store_(store), options_(std::move(options)), vault_(access_), registry_(access_),
        bonds_(registry_, registry_, vault_), yield_(bonds_, vault_, options_.yield_policy),
        markets_(access_, registry_, vault_, options_.default_liquidity),
        oracle_(access_, registry_, markets_, options_.oracle_policy) {
    replay();
    if (head_seq_ == 0)
      bootstrap();
  }

  Engine(const Engine &) = delete;
  Engine &operator=(const Engine &) = delete;

  // ==========================================================================
  // 角色 / collateral
  // ==========================================================================

  void grant_role(const Tx &tx, Role role, const std::string &account) {
    write(tx, [&](ledger::Batch &b) { access_.plan_grant(b, role, account); });
  }

  void revoke_role(const Tx &tx, Role role, const std::string &account) {
    write(tx, [&](ledger::Batch &b) { access_.plan_revoke(b, role, account); });
  }

  bool has_role(const std::string &account, Role role) const {
    return read([&] { return access_.has_role(account, role); });
  }

  void credit_collateral(const Tx &tx, const std::string &account, const Amount &amount) {
    write(tx, [&](ledger::Batch &b) { vault_.plan_credit(b, account, amount); });
  }

  Amount collateral_balance(const std::string &account) const {
    return read([&] { return vault_.balance_of(account); });
  }

  // ==========================================================================
  // ProjectRegistry
  // ==========================================================================

  std::string register_project(const Tx &tx, const std::string &name,
                               const std::string &metadata_uri, const Amount &funding_goal,
                               const Amount &bond_price) {
    return write(tx, [&](ledger::Batch &b) {
      return registry_.plan_register(b, name, metadata_uri, funding_goal, bond_price);
    });
  }

  void update_status(const Tx &tx, const std::string &project_id, ProjectStatus status) {
    write(tx, [&](ledger::Batch &b) { registry_.plan_update_status(b, project_id, status); });
  }

  Project get_project(const std::string &project_id) const {
    return read([&] { return registry_.get(project_id); });
  }

  std::vector<Project> all_projects() const {
    return read([&] { return registry_.all(); });
  }

  std::vector<Project> active_projects() const {
    return read([&] { return registry_.active(); });
  }

  size_t project_count() const {
    return read([&] { return registry_.count(); });
  }

  // ==========================================================================
  // BondLedger
  // ==========================================================================

  void create_bond(const Tx &tx, const std::string &project_id) {
    write(tx, [&](ledger::Batch &b) { bonds_.plan_create(b, project_id); });
  }

  Amount purchase_bonds(const Tx &tx, const std::string &project_id, const Amount &collateral) {
    return write(tx, [&](ledger::Batch &b) { return bonds_.plan_purchase(b, project_id, collateral); });
  }

  void transfer_bonds(const Tx &tx, const std::string &project_id, const std::string &to,
                      const Amount &amount) {
    write(tx, [&](ledger::Batch &b) { bonds_.plan_transfer(b, project_id, to, amount); });
  }

  Bond get_bond(const std::string &project_id) const {
    return read([&] { return bonds_.get(project_id); });
  }

  Amount bond_balance(const std::string &project_id, const std::string &holder) const {
    return read([&] { return bonds_.balance_of(project_id, holder); });
  }

  Amount bond_supply(const std::string &project_id) const {
    return read([&] { return bonds_.total_supply(project_id); });
  }

  std::map<std::string, Amount> bond_holders(const std::string &project_id) const {
    return read([&] {
      bonds_.get(project_id);
      return bonds_.holders(project_id);
    });
  }

  // ==========================================================================
  // YieldDistributor
  // ==========================================================================

  void deposit_revenue(const Tx &tx, const std::string &project_id, const Amount &amount) {
    write(tx, [&](ledger::Batch &b) { yield_.plan_deposit(b, project_id, amount); });
  }

  Amount claim_yield(const Tx &tx, const std::string &project_id) {
    return write(tx, [&](ledger::Batch &b) { return yield_.plan_claim(b, project_id); });
  }

  Amount claimable_yield(const std::string &project_id, const std::string &holder) const {
    return read([&] { return yield_.claimable(project_id, holder); });
  }

  YieldInfo yield_info(const std::string &project_id, int64_t now) const {
    return read([&] { return yield_.info(project_id, now); });
  }

  HolderYield holder_yield(const std::string &project_id, const std::string &holder) const {
    return read([&] { return yield_.holder_state(project_id, holder); });
  }

  int64_t last_claim_time(const std::string &project_id, const std::string &holder) const {
    return read([&] { return yield_.last_claim_time(project_id, holder); });
  }

  // ==========================================================================
  // MarketBook
  // ==========================================================================

  std::string create_market(const Tx &tx, const std::string &project_id,
                            const std::string &question, int64_t resolution_time,
                            const Amount &liquidity = 0) {
    return write(tx, [&](ledger::Batch &b) {
      return markets_.plan_create(b, project_id, question, resolution_time, liquidity);
    });
  }

  Amount buy(const Tx &tx, const std::string &market_id, bool is_yes, const Amount &shares) {
    return write(tx, [&](ledger::Batch &b) { return markets_.plan_buy(b, market_id, is_yes, shares); });
  }

  Amount sell(const Tx &tx, const std::string &market_id, bool is_yes, const Amount &shares) {
    return write(tx, [&](ledger::Batch &b) { return markets_.plan_sell(b, market_id, is_yes, shares); });
  }

  void transfer_outcome(const Tx &tx, const std::string &market_id, bool is_yes,
                        const std::string &to, const Amount &shares) {
    write(tx, [&](ledger::Batch &b) { markets_.plan_transfer(b, market_id, is_yes, to, shares); });
  }

  void resolve_market(const Tx &tx, const std::string &market_id, bool outcome) {
    write(tx, [&](ledger::Batch &b) { markets_.plan_resolve(b, market_id, outcome); });
  }

  Amount claim_winnings(const Tx &tx, const std::string &market_id) {
    return write(tx, [&](ledger::Batch &b) { return markets_.plan_claim(b, market_id); });
  }

  void fund_market(const Tx &tx, const std::string &market_id, const Amount &amount) {
    write(tx, [&](ledger::Batch &b) { markets_.plan_fund(b, market_id, amount); });
  }

  Market get_market(const std::string &market_id) const {
    return read([&] { return markets_.get(market_id); });
  }

  std::optional<Market> market_for_project(const std::string &project_id) const {
    return read([&]() -> std::optional<Market> {
      registry_.get(project_id);
      const Market *m = markets_.find_by_project(project_id);
      if (!m)
        return std::nullopt;
      return *m;
    });
  }

  std::vector<Market> all_markets() const {
    return read([&] { return markets_.all(); });
  }

  size_t market_count() const {
    return read([&] { return markets_.count(); });
  }

  std::vector<Trade> trades(const std::string &market_id) const {
    return read([&] { return markets_.trades(market_id); });
  }

  Position position(const std::string &market_id, const std::string &holder) const {
    return read([&] { return markets_.position(market_id, holder); });
  }

  Amount yes_price(const std::string &market_id) const {
    return read([&] { return markets_.yes_price(market_id); });
  }

  Amount no_price(const std::string &market_id) const {
    return read([&] { return markets_.no_price(market_id); });
  }

  Amount cost_to_buy(const std::string &market_id, bool is_yes, const Amount &shares) const {
    return read([&] { return markets_.cost_to_buy(market_id, is_yes, shares); });
  }

  Amount payout_for_sell(const std::string &market_id, bool is_yes, const Amount &shares) const {
    return read([&] { return markets_.payout_for_sell(market_id, is_yes, shares); });
  }

  Amount claimable_winnings(const std::string &market_id, const std::string &holder) const {
    return read([&] { return markets_.claimable_winnings(market_id, holder); });
  }

  Amount market_escrow(const std::string &market_id) const {
    return read([&] { return markets_.escrow_balance(market_id); });
  }

  // ==========================================================================
  // OracleAggregator
  // ==========================================================================

  void setup_milestones(const Tx &tx, const std::string &project_id,
                        const std::vector<std::string> &descriptions,
                        const std::vector<int64_t> &target_dates) {
    write(tx, [&](ledger::Batch &b) {
      oracle_.plan_setup_milestones(b, project_id, descriptions, target_dates);
    });
  }

  // 返回项目是否因此完成
  bool verify_milestone(const Tx &tx, const std::string &project_id, int index, bool verified,
                        const std::string &evidence_uri,
                        const std::vector<std::string> &data_sources, int confidence) {
    return write(tx, [&](ledger::Batch &b) {
      return oracle_.plan_verify(b, project_id, index, verified, evidence_uri, data_sources,
                                 confidence);
    });
  }

  void mark_project_failed(const Tx &tx, const std::string &project_id,
                           const std::string &reason) {
    write(tx, [&](ledger::Batch &b) { oracle_.plan_mark_failed(b, project_id, reason); });
  }

  void finalize_project(const Tx &tx, const std::string &project_id) {
    write(tx, [&](ledger::Batch &b) { oracle_.plan_finalize(b, project_id); });
  }

  // 每个项目单独提交, 一个项目失败不影响已提交的其他项目
  std::vector<SweepItem> sweep_overdue(const Tx &tx) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto items = oracle_.sweep_candidates(tx);
    for (const auto &item : items) {
      ledger::Batch batch(tx);
      oracle_.plan_sweep_item(batch, item);
      commit(batch);
    }
    return items;
  }

  ProjectProgress project_progress(const std::string &project_id) const {
    return read([&] { return oracle_.progress(project_id); });
  }

  std::vector<Milestone> milestones(const std::string &project_id) const {
    return read([&] { return registry_.milestones(project_id); });
  }

  Milestone milestone(const std::string &project_id, int index) const {
    return read([&] { return registry_.milestone(project_id, index); });
  }

  std::vector<VerificationRecord> verifications(const std::string &project_id) const {
    return read([&] { return registry_.verifications(project_id); });
  }

  // ==========================================================================
  // 事件日志
  // ==========================================================================

  int64_t head_seq() const {
    return read([&] { return head_seq_; });
  }

  std::vector<ledger::Event> events_since(int64_t after_seq, size_t limit) const {
    return store_.load_since(after_seq, limit);
  }

  const EngineOptions &options() const { return options_; }

private:
  template <typename Fn>
  std::invoke_result_t<Fn &, ledger::Batch &> write(const Tx &tx, Fn &&plan) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    ledger::Batch batch(tx);
    if constexpr (std::is_void_v<std::invoke_result_t<Fn &, ledger::Batch &>>) {
      plan(batch);
      commit(batch);
    } else {
      auto result = plan(batch);
      commit(batch);
      return result;
    }
  }

  template <typename Fn> std::invoke_result_t<Fn &> read(Fn &&fn) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return fn();
  }

  void commit(ledger::Batch &batch) {
    if (batch.empty())
      return;
    auto events = batch.take();
    int64_t seq = head_seq_;
    for (auto &e : events)
      e.seq = ++seq;

    store_.append(events);
    head_seq_ = seq;

    for (const auto &e : events) {
      apply(e);
      log_event(e);
    }
  }

  void apply(const ledger::Event &e) {
    access_.apply(e);
    vault_.apply(e);
    registry_.apply(e);
    bonds_.apply(e);
    yield_.apply(e);
    markets_.apply(e);
  }

  void replay() {
    auto events = store_.load_all();
    for (const auto &e : events) {
      if (e.seq <= head_seq_)
        throw std::runtime_error("事件日志乱序: seq " + std::to_string(e.seq) + " after " +
                                 std::to_string(head_seq_));
      apply(e);
      head_seq_ = e.seq;
    }
    std::cout << "[Engine] 回放 " << events.size() << " 条事件, head=" << head_seq_ << std::endl;
  }

  // 空日志时写入创世批次: admin + 配置的 oracle
  void bootstrap() {
    ledger::Batch batch(Tx{options_.admin, 0});
    access_.plan_bootstrap_grant(batch, Role::Admin, options_.admin);
    for (const auto &oracle : options_.oracles) {
      bool seen = false;
      for (const auto &e : batch.events()) {
        if (e.payload.at("role").get<Role>() == Role::Oracle &&
            e.payload.at("account").get<std::string>() == oracle)
          seen = true;
      }
      if (!seen)
        access_.plan_bootstrap_grant(batch, Role::Oracle, oracle);
    }
    commit(batch);
    std::cout << "[Engine] 创世: admin=" << options_.admin << ", oracles=" << options_.oracles.size()
              << std::endl;
  }

  static void log_event(const ledger::Event &e) {
    switch (e.type) {
    case ledger::EventType::ProjectRegistered:
    case ledger::EventType::ProjectStatusChanged:
    case ledger::EventType::ProjectMarkedFailed:
    case ledger::EventType::MarketCreated:
    case ledger::EventType::MarketResolved:
      std::cout << "[Engine] #" << e.seq << " " << ledger::event_type_name(e.type) << " "
                << e.payload.dump() << std::endl;
      break;
    default:
      break;
    }
  }

  ledger::EventStore &store_;
  EngineOptions options_;
  AccessControl access_;
  CollateralVault vault_;
  ProjectRegistry registry_;
  BondLedger bonds_;
  YieldDistributor yield_;
  MarketBook markets_;
  OracleAggregator oracle_;
  mutable std::shared_mutex mutex_;
  int64_t head_seq_ = 0;
};

} // namespace protocol
