#pragma once

#include <map>
#include <string>
#include <vector>

#include "../core/amount.hpp"
#include "../ledger/ledger_types.hpp"
#include "collateral_vault.hpp"
#include "errors.hpp"
#include "ports.hpp"
#include "types.hpp"

namespace protocol {

// ============================================================================
// BondLedger - 每个项目一个可互换 bond (18 位小数)
// ============================================================================
// minted = collateral * 1e18 / bond_price, 与付出的 collateral 严格成比例
class BondLedger {
public:
  BondLedger(const ProjectDirectory &projects, const FundingRecorder &funding,
             const CollateralVault &vault)
      : projects_(projects), funding_(funding), vault_(vault) {}

  const Bond *find(const std::string &project_id) const {
    auto it = bonds_.find(project_id);
    return it == bonds_.end() ? nullptr : &it->second;
  }

  const Bond &get(const std::string &project_id) const {
    const Bond *b = find(project_id);
    if (!b)
      throw NotFoundError("Bond not found for project " + project_id);
    return *b;
  }

  Amount balance_of(const std::string &project_id, const std::string &holder) const {
    auto it = holdings_.find(project_id);
    if (it == holdings_.end())
      return 0;
    auto h = it->second.find(holder);
    return h == it->second.end() ? Amount(0) : h->second;
  }

  Amount total_supply(const std::string &project_id) const {
    const Bond *b = find(project_id);
    return b ? b->total_supply : Amount(0);
  }

  std::map<std::string, Amount> holders(const std::string &project_id) const {
    auto it = holdings_.find(project_id);
    return it == holdings_.end() ? std::map<std::string, Amount>{} : it->second;
  }

  static Amount bonds_for(const Amount &collateral, const Amount &bond_price) {
    return collateral * units::WAD / bond_price;
  }

  void plan_create(ledger::Batch &batch, const std::string &project_id) const {
    const Project *p = projects_.find_project(project_id);
    if (!p)
      throw NotFoundError("Project not found: " + project_id);
    if (is_terminal(p->status))
      throw StateConflictError("Project " + project_id + " is " + status_name(p->status));
    if (find(project_id))
      throw StateConflictError("Bond already exists for " + project_id);

    batch.emit(ledger::EventType::BondCreated, project_id,
               {{"project_id", project_id}, {"bond_id", "bond-" + project_id},
                {"created_at", batch.now()}});
  }

  Amount plan_purchase(ledger::Batch &batch, const std::string &project_id,
                       const Amount &collateral) const {
    if (collateral <= 0)
      throw ValidationError("Amount must be > 0");
    const Project *p = projects_.find_project(project_id);
    if (!p)
      throw NotFoundError("Project not found: " + project_id);
    const Bond *b = find(project_id);
    if (!b)
      throw NotFoundError("Bond not created for " + project_id);
    if (p->status != ProjectStatus::Funding)
      throw StateConflictError("Project not in funding status");

    Amount minted = bonds_for(collateral, p->bond_price);
    if (minted == 0)
      throw ValidationError("Amount too small to mint any bond units");

    const std::string &buyer = batch.caller();
    vault_.plan_transfer(batch, project_id, buyer, CollateralVault::bond_escrow(project_id),
                         collateral);
    batch.emit(ledger::EventType::BondsPurchased, project_id,
               {{"project_id", project_id},
                {"buyer", buyer},
                {"collateral", collateral},
                {"bonds", minted},
                {"total_supply", b->total_supply + minted}});
    funding_.plan_record_funding(batch, project_id, collateral);
    return minted;
  }

  void plan_transfer(ledger::Batch &batch, const std::string &project_id, const std::string &to,
                     const Amount &amount) const {
    if (amount <= 0)
      throw ValidationError("Amount must be > 0");
    if (to.empty())
      throw ValidationError("Invalid address");
    const std::string &from = batch.caller();
    if (to == from)
      throw ValidationError("Cannot transfer to self");
    get(project_id);
    Amount have = balance_of(project_id, from);
    if (have < amount)
      throw InsufficientSharesError("insufficient bond balance: have " + have.str() + ", need " +
                                    amount.str());

    batch.emit(ledger::EventType::BondsTransferred, project_id,
               {{"project_id", project_id}, {"from", from}, {"to", to}, {"amount", amount}});
  }

  void apply(const ledger::Event &e) {
    switch (e.type) {
    case ledger::EventType::BondCreated: {
      Bond b;
      b.bond_id = e.payload.at("bond_id").get<std::string>();
      b.project_id = e.project_id;
      b.created_at = e.payload.at("created_at").get<int64_t>();
      bonds_[e.project_id] = std::move(b);
      break;
    }
    case ledger::EventType::BondsPurchased: {
      Bond &b = bonds_.at(e.project_id);
      Amount minted = e.payload.at("bonds").get<Amount>();
      b.total_supply += minted;
      b.collateral_raised += e.payload.at("collateral").get<Amount>();
      holdings_[e.project_id][e.payload.at("buyer").get<std::string>()] += minted;
      break;
    }
    case ledger::EventType::BondsTransferred: {
      Amount amount = e.payload.at("amount").get<Amount>();
      auto &book = holdings_[e.project_id];
      book[e.payload.at("from").get<std::string>()] -= amount;
      book[e.payload.at("to").get<std::string>()] += amount;
      break;
    }
    default:
      break;
    }
  }

private:
  const ProjectDirectory &projects_;
  const FundingRecorder &funding_;
  const CollateralVault &vault_;
  std::map<std::string, Bond> bonds_;
  std::map<std::string, std::map<std::string, Amount>> holdings_;
};

} // namespace protocol
