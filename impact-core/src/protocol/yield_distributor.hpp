#pragma once

#include <map>
#include <string>
#include <utility>

#include "../core/amount.hpp"
#include "../ledger/ledger_types.hpp"
#include "bond_ledger.hpp"
#include "collateral_vault.hpp"
#include "errors.hpp"
#include "types.hpp"

namespace protocol {

enum class YieldPolicy {
  // balance * (deposited - distributed) / supply
  RemainingPool,
  // balance * deposited / supply - 已领取, 截断到 [0, deposited - distributed]
  Cumulative,
};

inline YieldPolicy yield_policy_from_name(const std::string &name) {
  if (name == "remaining_pool")
    return YieldPolicy::RemainingPool;
  if (name == "cumulative")
    return YieldPolicy::Cumulative;
  throw std::invalid_argument("unknown yield_policy: " + name);
}

// ============================================================================
// YieldDistributor - 收益池与按持仓比例领取
// ============================================================================
// 持仓比例实时按当前 bond 余额计算, 转账时不做快照
class YieldDistributor {
public:
  static constexpr int64_t SECONDS_PER_YEAR = 365LL * 24 * 3600;

  YieldDistributor(const BondLedger &bonds, const CollateralVault &vault, YieldPolicy policy)
      : bonds_(bonds), vault_(vault), policy_(policy) {}

  YieldPolicy policy() const { return policy_; }

  YieldPool pool(const std::string &project_id) const {
    auto it = pools_.find(project_id);
    if (it != pools_.end())
      return it->second;
    YieldPool empty;
    empty.project_id = project_id;
    return empty;
  }

  HolderYield holder_state(const std::string &project_id, const std::string &holder) const {
    auto it = holders_.find({project_id, holder});
    return it == holders_.end() ? HolderYield{} : it->second;
  }

  int64_t last_claim_time(const std::string &project_id, const std::string &holder) const {
    return holder_state(project_id, holder).last_claim_at;
  }

  Amount claimable(const std::string &project_id, const std::string &holder) const {
    Amount supply = bonds_.total_supply(project_id);
    Amount balance = bonds_.balance_of(project_id, holder);
    if (supply == 0 || balance == 0)
      return 0;

    YieldPool p = pool(project_id);
    Amount undistributed = p.total_deposited - p.total_distributed;
    if (undistributed <= 0)
      return 0;

    if (policy_ == YieldPolicy::RemainingPool)
      return balance * undistributed / supply;

    Amount owed = balance * p.total_deposited / supply - holder_state(project_id, holder).total_claimed;
    if (owed < 0)
      return 0;
    return owed > undistributed ? undistributed : owed;
  }

  YieldInfo info(const std::string &project_id, int64_t now) const {
    const Bond &b = bonds_.get(project_id);
    YieldPool p = pool(project_id);

    YieldInfo out;
    out.total_revenue = p.total_deposited;
    out.distributed = p.total_distributed;
    int64_t elapsed = now - b.created_at;
    if (elapsed > 0 && b.collateral_raised > 0) {
      Amount apy = p.total_distributed * 10000 * SECONDS_PER_YEAR /
                   (b.collateral_raised * elapsed);
      out.apy_bps = apy.convert_to<int64_t>();
    }
    return out;
  }

  void plan_deposit(ledger::Batch &batch, const std::string &project_id,
                    const Amount &amount) const {
    if (amount <= 0)
      throw ValidationError("Amount must be > 0");
    if (!bonds_.find(project_id))
      throw NotFoundError("Bond not found for project " + project_id);

    vault_.plan_transfer(batch, project_id, batch.caller(),
                         CollateralVault::yield_escrow(project_id), amount);
    batch.emit(ledger::EventType::RevenueDeposited, project_id,
               {{"project_id", project_id},
                {"depositor", batch.caller()},
                {"amount", amount},
                {"total_revenue", pool(project_id).total_deposited + amount}});
  }

  Amount plan_claim(ledger::Batch &batch, const std::string &project_id) const {
    if (!bonds_.find(project_id))
      throw NotFoundError("Bond not found for project " + project_id);
    const std::string &holder = batch.caller();
    Amount amount = claimable(project_id, holder);
    if (amount == 0)
      throw StateConflictError("No yield to claim");

    vault_.plan_transfer(batch, project_id, CollateralVault::yield_escrow(project_id), holder,
                         amount);
    batch.emit(ledger::EventType::YieldClaimed, project_id,
               {{"project_id", project_id},
                {"holder", holder},
                {"amount", amount},
                {"total_distributed", pool(project_id).total_distributed + amount},
                {"at", batch.now()}});
    return amount;
  }

  void apply(const ledger::Event &e) {
    switch (e.type) {
    case ledger::EventType::RevenueDeposited: {
      auto &p = pools_[e.project_id];
      p.project_id = e.project_id;
      p.total_deposited = e.payload.at("total_revenue").get<Amount>();
      break;
    }
    case ledger::EventType::YieldClaimed: {
      auto &p = pools_[e.project_id];
      p.project_id = e.project_id;
      p.total_distributed = e.payload.at("total_distributed").get<Amount>();
      auto &h = holders_[{e.project_id, e.payload.at("holder").get<std::string>()}];
      h.last_claim_at = e.payload.at("at").get<int64_t>();
      h.total_claimed += e.payload.at("amount").get<Amount>();
      break;
    }
    default:
      break;
    }
  }

private:
  const BondLedger &bonds_;
  const CollateralVault &vault_;
  YieldPolicy policy_;
  std::map<std::string, YieldPool> pools_;
  // (project, holder)
  std::map<std::pair<std::string, std::string>, HolderYield> holders_;
};

} // namespace protocol
