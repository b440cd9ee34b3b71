#pragma once

#include <map>
#include <string>

#include "../core/amount.hpp"
#include "../ledger/ledger_types.hpp"
#include "access_control.hpp"
#include "errors.hpp"

namespace protocol {

// ============================================================================
// CollateralVault - 6 位小数稳定币余额
// ============================================================================
// 稳定币本身在外部; 这里记录已转入核心的余额和各组件的托管账户
class CollateralVault {
public:
  explicit CollateralVault(const AccessControl &access) : access_(access) {}

  static std::string bond_escrow(const std::string &project_id) { return "bond:" + project_id; }
  static std::string yield_escrow(const std::string &project_id) { return "yield:" + project_id; }
  static std::string market_escrow(const std::string &market_id) { return "market:" + market_id; }

  Amount balance_of(const std::string &account) const {
    auto it = balances_.find(account);
    return it == balances_.end() ? Amount(0) : it->second;
  }

  // 外部稳定币入账, 仅 admin
  void plan_credit(ledger::Batch &batch, const std::string &account, const Amount &amount) const {
    access_.require(batch.caller(), Role::Admin);
    if (account.empty())
      throw ValidationError("Invalid address");
    if (amount <= 0)
      throw ValidationError("Amount must be > 0");
    batch.emit(ledger::EventType::CollateralCredited, "",
               {{"account", account}, {"amount", amount}, {"balance", balance_of(account) + amount}});
  }

  void plan_transfer(ledger::Batch &batch, const std::string &project_id, const std::string &from,
                     const std::string &to, const Amount &amount) const {
    if (amount == 0)
      return;
    Amount available = balance_of(from);
    if (available < amount)
      throw InsufficientFundsError("insufficient collateral in '" + from + "': have " +
                                   available.str() + ", need " + amount.str());
    batch.emit(ledger::EventType::CollateralTransferred, project_id,
               {{"from", from}, {"to", to}, {"amount", amount}});
  }

  void apply(const ledger::Event &e) {
    switch (e.type) {
    case ledger::EventType::CollateralCredited:
      balances_[e.payload.at("account").get<std::string>()] += e.payload.at("amount").get<Amount>();
      break;
    case ledger::EventType::CollateralTransferred: {
      Amount amount = e.payload.at("amount").get<Amount>();
      balances_[e.payload.at("from").get<std::string>()] -= amount;
      balances_[e.payload.at("to").get<std::string>()] += amount;
      break;
    }
    default:
      break;
    }
  }

private:
  const AccessControl &access_;
  std::map<std::string, Amount> balances_;
};

} // namespace protocol
