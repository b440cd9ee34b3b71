#pragma once

// ============================================================================
// MarketBook - 每个项目最多一个 LMSR YES/NO 市场
// ============================================================================
// 1. 买入: 支付 ceil((C(after) - C(now)) / 1e12) collateral, 铸造 shares
// 2. 卖出: 销毁 shares, 获得 floor((C(now) - C(after)) / 1e12)
// 3. 结算: oracle 在截止时间后结算; 项目完成/失败时由 aggregator 提前结算
// 4. 兑付: 每 1e18 获胜 share 兑付 1e6 collateral, 托管不足时需要 fund_market 补足

#include <cstdio>
#include <map>
#include <string>
#include <vector>

#include "../core/amount.hpp"
#include "../ledger/ledger_types.hpp"
#include "access_control.hpp"
#include "collateral_vault.hpp"
#include "errors.hpp"
#include "lmsr.hpp"
#include "ports.hpp"
#include "types.hpp"

namespace protocol {

class MarketBook : public MarketResolver {
public:
  MarketBook(const AccessControl &access, const ProjectDirectory &projects,
             const CollateralVault &vault, Amount default_liquidity)
      : access_(access), projects_(projects), vault_(vault),
        default_liquidity_(default_liquidity) {}

  // ==========================================================================
  // 查询
  // ==========================================================================

  const Market &get(const std::string &market_id) const {
    auto it = markets_.find(market_id);
    if (it == markets_.end())
      throw NotFoundError("Market not found: " + market_id);
    return it->second;
  }

  const Market *find_by_project(const std::string &project_id) const {
    auto it = by_project_.find(project_id);
    return it == by_project_.end() ? nullptr : &markets_.at(it->second);
  }

  std::vector<Market> all() const {
    std::vector<Market> out;
    out.reserve(order_.size());
    for (const auto &id : order_)
      out.push_back(markets_.at(id));
    return out;
  }

  size_t count() const { return order_.size(); }

  const Amount &default_liquidity() const { return default_liquidity_; }

  Position position(const std::string &market_id, const std::string &holder) const {
    get(market_id);
    auto it = positions_.find(market_id);
    if (it == positions_.end())
      return {};
    auto p = it->second.find(holder);
    return p == it->second.end() ? Position{} : p->second;
  }

  std::vector<Trade> trades(const std::string &market_id) const {
    get(market_id);
    auto it = trades_.find(market_id);
    return it == trades_.end() ? std::vector<Trade>{} : it->second;
  }

  Amount yes_price(const std::string &market_id) const {
    const Market &m = get(market_id);
    return lmsr::price_yes(m.yes_shares, m.no_shares, m.liquidity);
  }

  Amount no_price(const std::string &market_id) const {
    const Market &m = get(market_id);
    return lmsr::price_no(m.yes_shares, m.no_shares, m.liquidity);
  }

  Amount cost_to_buy(const std::string &market_id, bool is_yes, const Amount &shares) const {
    const Market &m = get(market_id);
    if (shares <= 0)
      throw ValidationError("Shares must be > 0");
    Amount before = lmsr::cost(m.yes_shares, m.no_shares, m.liquidity);
    Amount after = is_yes ? lmsr::cost(m.yes_shares + shares, m.no_shares, m.liquidity)
                          : lmsr::cost(m.yes_shares, m.no_shares + shares, m.liquidity);
    return units::ceil_div(after - before, units::WAD_TO_USDC);
  }

  Amount payout_for_sell(const std::string &market_id, bool is_yes, const Amount &shares) const {
    const Market &m = get(market_id);
    if (shares <= 0)
      throw ValidationError("Shares must be > 0");
    const Amount &outstanding = is_yes ? m.yes_shares : m.no_shares;
    if (shares > outstanding)
      throw InsufficientSharesError("cannot sell " + shares.str() + " shares, only " +
                                    outstanding.str() + " outstanding");
    Amount before = lmsr::cost(m.yes_shares, m.no_shares, m.liquidity);
    Amount after = is_yes ? lmsr::cost(m.yes_shares - shares, m.no_shares, m.liquidity)
                          : lmsr::cost(m.yes_shares, m.no_shares - shares, m.liquidity);
    Amount diff = before - after;
    return diff <= 0 ? Amount(0) : diff / units::WAD_TO_USDC;
  }

  Amount claimable_winnings(const std::string &market_id, const std::string &holder) const {
    const Market &m = get(market_id);
    if (!m.resolved)
      return 0;
    Position p = position(market_id, holder);
    return (m.outcome ? p.yes : p.no) / units::WAD_TO_USDC;
  }

  Amount escrow_balance(const std::string &market_id) const {
    get(market_id);
    return vault_.balance_of(CollateralVault::market_escrow(market_id));
  }

  // ==========================================================================
  // 规划
  // ==========================================================================

  std::string plan_create(ledger::Batch &batch, const std::string &project_id,
                          const std::string &question, int64_t resolution_time,
                          const Amount &liquidity) const {
    if (question.empty())
      throw ValidationError("Question required");
    if (liquidity < 0)
      throw ValidationError("Liquidity must be >= 0");
    if (resolution_time <= batch.now())
      throw ValidationError("Resolution time in past");
    const Project *p = projects_.find_project(project_id);
    if (!p)
      throw NotFoundError("Project not found: " + project_id);
    if (is_terminal(p->status))
      throw StateConflictError("Project " + project_id + " is " + status_name(p->status));
    if (by_project_.contains(project_id))
      throw StateConflictError("Market already exists for " + project_id);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "mkt-%06zu", order_.size() + 1);
    std::string market_id = buf;

    batch.emit(ledger::EventType::MarketCreated, project_id,
               {{"market_id", market_id},
                {"project_id", project_id},
                {"question", question},
                {"resolution_time", resolution_time},
                {"liquidity", liquidity == 0 ? default_liquidity_ : liquidity},
                {"created_at", batch.now()}});
    return market_id;
  }

  Amount plan_buy(ledger::Batch &batch, const std::string &market_id, bool is_yes,
                  const Amount &shares) const {
    const Market &m = get(market_id);
    if (m.resolved)
      throw StateConflictError("Market already resolved");
    Amount cost = cost_to_buy(market_id, is_yes, shares);

    vault_.plan_transfer(batch, m.project_id, batch.caller(),
                         CollateralVault::market_escrow(market_id), cost);
    emit_trade(batch, m, is_yes, true, shares, cost);
    return cost;
  }

  Amount plan_sell(ledger::Batch &batch, const std::string &market_id, bool is_yes,
                   const Amount &shares) const {
    const Market &m = get(market_id);
    if (m.resolved)
      throw StateConflictError("Market already resolved");
    if (shares <= 0)
      throw ValidationError("Shares must be > 0");
    Position held = position(market_id, batch.caller());
    const Amount &balance = is_yes ? held.yes : held.no;
    if (balance < shares)
      throw InsufficientSharesError("Insufficient shares: have " + balance.str() + ", selling " +
                                    shares.str());
    Amount payout = payout_for_sell(market_id, is_yes, shares);

    vault_.plan_transfer(batch, m.project_id, CollateralVault::market_escrow(market_id),
                         batch.caller(), payout);
    emit_trade(batch, m, is_yes, false, shares, payout);
    return payout;
  }

  void plan_transfer(ledger::Batch &batch, const std::string &market_id, bool is_yes,
                     const std::string &to, const Amount &shares) const {
    const Market &m = get(market_id);
    if (shares <= 0)
      throw ValidationError("Shares must be > 0");
    if (to.empty())
      throw ValidationError("Invalid address");
    if (to == batch.caller())
      throw ValidationError("Cannot transfer to self");
    Position held = position(market_id, batch.caller());
    const Amount &balance = is_yes ? held.yes : held.no;
    if (balance < shares)
      throw InsufficientSharesError("Insufficient shares: have " + balance.str() + ", sending " +
                                    shares.str());

    batch.emit(ledger::EventType::OutcomeTransferred, m.project_id,
               {{"market_id", market_id},
                {"is_yes", is_yes},
                {"from", batch.caller()},
                {"to", to},
                {"shares", shares}});
  }

  // 常规结算: 仅 oracle, 且已过截止时间
  void plan_resolve(ledger::Batch &batch, const std::string &market_id, bool outcome) const {
    access_.require(batch.caller(), Role::Oracle);
    const Market &m = get(market_id);
    if (m.resolved)
      throw StateConflictError("Market already resolved");
    if (batch.now() < m.resolution_time)
      throw StateConflictError("Resolution time not reached");
    emit_resolution(batch, m, outcome, false);
  }

  // 项目完成/失败时的提前结算; 无市场或已结算时什么也不做
  void plan_early_resolve(ledger::Batch &batch, const std::string &project_id,
                          bool outcome) const override {
    const Market *m = find_by_project(project_id);
    if (!m || m->resolved)
      return;
    emit_resolution(batch, *m, outcome, true);
  }

  // 败方或无持仓返回 0, 不产生事件
  Amount plan_claim(ledger::Batch &batch, const std::string &market_id) const {
    const Market &m = get(market_id);
    if (!m.resolved)
      throw StateConflictError("Market not resolved");
    Position held = position(market_id, batch.caller());
    Amount shares = m.outcome ? held.yes : held.no;
    if (shares == 0)
      return 0;
    Amount payout = shares / units::WAD_TO_USDC;

    vault_.plan_transfer(batch, m.project_id, CollateralVault::market_escrow(market_id),
                         batch.caller(), payout);
    batch.emit(ledger::EventType::WinningsClaimed, m.project_id,
               {{"market_id", market_id},
                {"holder", batch.caller()},
                {"is_yes", m.outcome},
                {"shares", shares},
                {"payout", payout}});
    return payout;
  }

  void plan_fund(ledger::Batch &batch, const std::string &market_id, const Amount &amount) const {
    const Market &m = get(market_id);
    if (amount <= 0)
      throw ValidationError("Amount must be > 0");
    vault_.plan_transfer(batch, m.project_id, batch.caller(),
                         CollateralVault::market_escrow(market_id), amount);
    batch.emit(ledger::EventType::MarketFunded, m.project_id,
               {{"market_id", market_id}, {"funder", batch.caller()}, {"amount", amount}});
  }

  // ==========================================================================
  // 应用
  // ==========================================================================

  void apply(const ledger::Event &e) {
    switch (e.type) {
    case ledger::EventType::MarketCreated: {
      Market m;
      m.id = e.payload.at("market_id").get<std::string>();
      m.project_id = e.project_id;
      m.question = e.payload.at("question").get<std::string>();
      m.resolution_time = e.payload.at("resolution_time").get<int64_t>();
      m.liquidity = e.payload.at("liquidity").get<Amount>();
      m.created_at = e.payload.at("created_at").get<int64_t>();
      order_.push_back(m.id);
      by_project_[m.project_id] = m.id;
      markets_[m.id] = std::move(m);
      break;
    }
    case ledger::EventType::SharesTraded:
      apply_trade(e);
      break;
    case ledger::EventType::OutcomeTransferred: {
      const auto &id = e.payload.at("market_id").get_ref<const std::string &>();
      bool is_yes = e.payload.at("is_yes").get<bool>();
      Amount shares = e.payload.at("shares").get<Amount>();
      auto &book = positions_[id];
      side(book[e.payload.at("from").get<std::string>()], is_yes) -= shares;
      side(book[e.payload.at("to").get<std::string>()], is_yes) += shares;
      break;
    }
    case ledger::EventType::MarketResolved: {
      Market &m = markets_.at(e.payload.at("market_id").get<std::string>());
      m.resolved = true;
      m.outcome = e.payload.at("outcome").get<bool>();
      m.early_resolution = e.payload.at("early").get<bool>();
      m.resolved_at = e.payload.at("at").get<int64_t>();
      break;
    }
    case ledger::EventType::WinningsClaimed: {
      const auto &id = e.payload.at("market_id").get_ref<const std::string &>();
      Market &m = markets_.at(id);
      bool is_yes = e.payload.at("is_yes").get<bool>();
      Amount shares = e.payload.at("shares").get<Amount>();
      side(positions_[id][e.payload.at("holder").get<std::string>()], is_yes) -= shares;
      (is_yes ? m.yes_shares : m.no_shares) -= shares;
      break;
    }
    default:
      break;
    }
  }

private:
  static Amount &side(Position &p, bool is_yes) { return is_yes ? p.yes : p.no; }

  void emit_trade(ledger::Batch &batch, const Market &m, bool is_yes, bool is_buy,
                  const Amount &shares, const Amount &collateral) const {
    Amount delta = is_buy ? shares : Amount(-shares);
    Amount yes_after = m.yes_shares + (is_yes ? delta : Amount(0));
    Amount no_after = m.no_shares + (is_yes ? Amount(0) : delta);
    batch.emit(ledger::EventType::SharesTraded, m.project_id,
               {{"market_id", m.id},
                {"trader", batch.caller()},
                {"is_yes", is_yes},
                {"is_buy", is_buy},
                {"shares", shares},
                {"collateral", collateral},
                {"yes_shares", yes_after},
                {"no_shares", no_after},
                {"yes_price", lmsr::price_yes(yes_after, no_after, m.liquidity)},
                {"at", batch.now()}});
  }

  void emit_resolution(ledger::Batch &batch, const Market &m, bool outcome, bool early) const {
    batch.emit(ledger::EventType::MarketResolved, m.project_id,
               {{"market_id", m.id}, {"outcome", outcome}, {"early", early}, {"at", batch.now()}});
  }

  void apply_trade(const ledger::Event &e) {
    Trade t;
    t.market_id = e.payload.at("market_id").get<std::string>();
    t.trader = e.payload.at("trader").get<std::string>();
    t.is_yes = e.payload.at("is_yes").get<bool>();
    t.is_buy = e.payload.at("is_buy").get<bool>();
    t.shares = e.payload.at("shares").get<Amount>();
    t.collateral = e.payload.at("collateral").get<Amount>();
    t.timestamp = e.payload.at("at").get<int64_t>();

    Market &m = markets_.at(t.market_id);
    m.yes_shares = e.payload.at("yes_shares").get<Amount>();
    m.no_shares = e.payload.at("no_shares").get<Amount>();
    m.volume += t.collateral;

    Amount &held = side(positions_[t.market_id][t.trader], t.is_yes);
    if (t.is_buy)
      held += t.shares;
    else
      held -= t.shares;
    trades_[t.market_id].push_back(std::move(t));
  }

  const AccessControl &access_;
  const ProjectDirectory &projects_;
  const CollateralVault &vault_;
  Amount default_liquidity_;
  std::map<std::string, Market> markets_;
  std::vector<std::string> order_;
  std::map<std::string, std::string> by_project_;
  std::map<std::string, std::map<std::string, Position>> positions_;
  std::map<std::string, std::vector<Trade>> trades_;
};

} // namespace protocol
