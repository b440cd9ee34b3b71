#pragma once

#include <string>
#include <utility>

#include "core/amount.hpp"
#include "ledger/event_store.hpp"
#include "protocol/engine.hpp"

namespace fixtures {

constexpr int64_t T0 = 1700000000;
constexpr int64_t DAY = 86400;

inline protocol::EngineOptions default_options() {
  protocol::EngineOptions o;
  o.admin = "admin";
  o.oracles = {"oracle"};
  return o;
}

inline ledger::Tx as(const std::string &who, int64_t now = T0) { return {who, now}; }

// 内存事件日志 + 创世角色: admin / oracle
struct EngineSetup {
  ledger::MemoryEventStore store;
  protocol::Engine engine;

  explicit EngineSetup(protocol::EngineOptions options = default_options())
      : engine(store, std::move(options)) {}

  void fund(const std::string &who, int64_t whole_usdc) {
    engine.credit_collateral(as("admin"), who, units::usdc(whole_usdc));
  }

  // 注册 -> Funding -> 创建 bond
  std::string funding_project(int64_t goal_usdc, int64_t price_usdc,
                              const std::string &sponsor = "sponsor") {
    auto id = engine.register_project(as(sponsor), "Solar Farm", "ipfs://solar-farm",
                                      units::usdc(goal_usdc), units::usdc(price_usdc));
    engine.update_status(as("oracle"), id, protocol::ProjectStatus::Funding);
    engine.create_bond(as(sponsor), id);
    return id;
  }

  Amount usdc_of(const std::string &who) const { return engine.collateral_balance(who); }
};

} // namespace fixtures
