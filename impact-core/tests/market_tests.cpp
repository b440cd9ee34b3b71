// ============================================================================
// MarketBook 测试
// ============================================================================
//
// Tests:
//   1. 创建: 默认流动性, 参数校验, 每个项目一个市场
//   2. 交易: 初始价格, 价格随买入单调变化, 成本/卖出边界
//   3. 结算: oracle + 截止时间, 只能一次, 之后不能交易
//   4. 兑付: 获胜方 1 share = 1 collateral, 败方 0 且不改变状态
//   5. outcome token 转账和托管补足
//
// ============================================================================

#include <boost/test/unit_test.hpp>

#include "protocol/errors.hpp"
#include "protocol/types.hpp"
#include "test_fixtures.hpp"

using namespace fixtures;

namespace {

constexpr int64_t DEADLINE = T0 + 30 * DAY;

struct MarketSetup : EngineSetup {
  MarketSetup() {
    project = funding_project(100000, 10);
    market = engine.create_market(as("sponsor"), project, "Will the solar farm reach COD by Q4?",
                                  DEADLINE);
    fund("alice", 300000);
    fund("bob", 1000);
    fund("backstop", 1000);
  }

  std::string project;
  std::string market;
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(market_tests, MarketSetup)

// =============================================================================
// Test 1: 创建
// =============================================================================

BOOST_AUTO_TEST_CASE(create_uses_default_liquidity) {
  auto m = engine.get_market(market);
  BOOST_CHECK_EQUAL(m.id, "mkt-000001");
  BOOST_CHECK_EQUAL(m.project_id, project);
  BOOST_CHECK_EQUAL(m.liquidity, units::wad(1000));
  BOOST_CHECK_EQUAL(m.resolution_time, DEADLINE);
  BOOST_CHECK_EQUAL(m.yes_shares, 0);
  BOOST_CHECK_EQUAL(m.no_shares, 0);
  BOOST_CHECK(!m.resolved);
  BOOST_CHECK_EQUAL(engine.get_project(project).market_id, market);

  auto found = engine.market_for_project(project);
  BOOST_REQUIRE(found.has_value());
  BOOST_CHECK_EQUAL(found->id, market);
  BOOST_CHECK_EQUAL(engine.market_count(), 1u);
}

BOOST_AUTO_TEST_CASE(create_rules) {
  BOOST_CHECK_THROW(engine.create_market(as("sponsor"), project, "again?", DEADLINE),
                    protocol::StateConflictError);
  BOOST_CHECK_THROW(engine.create_market(as("sponsor"), "prj-000099", "who?", DEADLINE),
                    protocol::NotFoundError);

  auto other = engine.register_project(as("sponsor"), "Wind", "ipfs://wind", units::usdc(10),
                                       units::usdc(1));
  BOOST_CHECK_THROW(engine.create_market(as("sponsor"), other, "", DEADLINE),
                    protocol::ValidationError);
  BOOST_CHECK_THROW(engine.create_market(as("sponsor"), other, "late?", T0),
                    protocol::ValidationError);
  BOOST_CHECK_THROW(engine.create_market(as("sponsor"), other, "negative?", DEADLINE, -1),
                    protocol::ValidationError);

  auto id = engine.create_market(as("sponsor"), other, "custom?", DEADLINE, units::wad(50));
  BOOST_CHECK_EQUAL(engine.get_market(id).liquidity, units::wad(50));
  BOOST_CHECK_EQUAL(engine.market_count(), 2u);

  auto bare = engine.register_project(as("s"), "X", "ipfs://x", units::usdc(1), units::usdc(1));
  BOOST_CHECK(!engine.market_for_project(bare).has_value());
  BOOST_CHECK_THROW(engine.get_market("mkt-000404"), protocol::NotFoundError);
}

// =============================================================================
// Test 2: 交易
// =============================================================================

BOOST_AUTO_TEST_CASE(initial_prices_are_even) {
  BOOST_CHECK_EQUAL(engine.yes_price(market), units::WAD / 2);
  BOOST_CHECK_EQUAL(engine.no_price(market), units::WAD / 2);
}

BOOST_AUTO_TEST_CASE(buy_moves_price_and_pays_escrow) {
  Amount quoted = engine.cost_to_buy(market, true, units::wad(100));
  Amount cost = engine.buy(as("alice"), market, true, units::wad(100));
  BOOST_CHECK_EQUAL(cost, quoted);
  // 价格从 0.5 开始上升, 100 share 的成本介于 50 和 100 之间
  BOOST_CHECK(cost > units::usdc(50));
  BOOST_CHECK(cost < units::usdc(100));

  BOOST_CHECK(engine.yes_price(market) > units::WAD / 2);
  BOOST_CHECK(engine.no_price(market) < units::WAD / 2);
  BOOST_CHECK_EQUAL(engine.yes_price(market) + engine.no_price(market), units::WAD);

  BOOST_CHECK_EQUAL(usdc_of("alice"), units::usdc(300000) - cost);
  BOOST_CHECK_EQUAL(engine.market_escrow(market), cost);
  BOOST_CHECK_EQUAL(engine.position(market, "alice").yes, units::wad(100));
  BOOST_CHECK_EQUAL(engine.get_market(market).yes_shares, units::wad(100));
  BOOST_CHECK_EQUAL(engine.get_market(market).volume, cost);

  auto trades = engine.trades(market);
  BOOST_REQUIRE_EQUAL(trades.size(), 1u);
  BOOST_CHECK(trades[0].is_yes);
  BOOST_CHECK(trades[0].is_buy);
  BOOST_CHECK_EQUAL(trades[0].collateral, cost);
}

BOOST_AUTO_TEST_CASE(price_is_monotonic_in_buys) {
  Amount last = engine.yes_price(market);
  for (int i = 0; i < 5; ++i) {
    engine.buy(as("alice"), market, true, units::wad(50));
    Amount now = engine.yes_price(market);
    BOOST_CHECK(now > last);
    last = now;
  }
  engine.buy(as("bob"), market, false, units::wad(50));
  BOOST_CHECK(engine.yes_price(market) < last);
}

BOOST_AUTO_TEST_CASE(cost_grows_with_size) {
  Amount c10 = engine.cost_to_buy(market, true, units::wad(10));
  Amount c20 = engine.cost_to_buy(market, true, units::wad(20));
  Amount c40 = engine.cost_to_buy(market, true, units::wad(40));
  BOOST_CHECK(c10 < c20);
  BOOST_CHECK(c20 < c40);
  // 两侧对称
  BOOST_CHECK_EQUAL(c10, engine.cost_to_buy(market, false, units::wad(10)));
  BOOST_CHECK_THROW(engine.cost_to_buy(market, true, 0), protocol::ValidationError);
}

BOOST_AUTO_TEST_CASE(round_trip_never_profits) {
  Amount cost = engine.buy(as("bob"), market, true, units::wad(25));
  Amount payout = engine.sell(as("bob"), market, true, units::wad(25));
  BOOST_CHECK(payout <= cost);
  BOOST_CHECK(cost - payout <= 1);
  BOOST_CHECK_EQUAL(engine.position(market, "bob").yes, 0);
  BOOST_CHECK_EQUAL(engine.yes_price(market), units::WAD / 2);
  BOOST_CHECK_EQUAL(usdc_of("bob"), units::usdc(1000) - cost + payout);
}

BOOST_AUTO_TEST_CASE(sell_rules) {
  engine.buy(as("bob"), market, false, units::wad(10));
  BOOST_CHECK_THROW(engine.sell(as("bob"), market, false, units::wad(11)),
                    protocol::InsufficientSharesError);
  BOOST_CHECK_THROW(engine.sell(as("bob"), market, true, units::wad(1)),
                    protocol::InsufficientSharesError);
  BOOST_CHECK_THROW(engine.sell(as("bob"), market, false, 0), protocol::ValidationError);
  BOOST_CHECK_THROW(engine.payout_for_sell(market, false, units::wad(11)),
                    protocol::InsufficientSharesError);
  BOOST_CHECK(engine.payout_for_sell(market, false, units::wad(10)) > 0);
}

BOOST_AUTO_TEST_CASE(failed_buy_changes_nothing) {
  int64_t head = engine.head_seq();
  BOOST_CHECK_THROW(engine.buy(as("carol"), market, true, units::wad(10)),
                    protocol::InsufficientFundsError);
  BOOST_CHECK_THROW(engine.buy(as("alice"), market, true, 0), protocol::ValidationError);
  BOOST_CHECK_EQUAL(engine.head_seq(), head);
  BOOST_CHECK_EQUAL(engine.yes_price(market), units::WAD / 2);
  BOOST_CHECK(engine.trades(market).empty());
}

BOOST_AUTO_TEST_CASE(large_buy_saturates_price) {
  engine.buy(as("alice"), market, true, units::wad(200000));
  BOOST_CHECK_EQUAL(engine.yes_price(market), units::WAD);
  BOOST_CHECK_EQUAL(engine.no_price(market), 0);
}

// =============================================================================
// Test 3: 结算
// =============================================================================

BOOST_AUTO_TEST_CASE(resolve_requires_oracle_and_deadline) {
  BOOST_CHECK_THROW(engine.resolve_market(as("alice", DEADLINE), market, true),
                    protocol::AuthorizationError);
  BOOST_CHECK_THROW(engine.resolve_market(as("oracle", DEADLINE - 1), market, true),
                    protocol::StateConflictError);

  engine.resolve_market(as("oracle", DEADLINE), market, true);
  auto m = engine.get_market(market);
  BOOST_CHECK(m.resolved);
  BOOST_CHECK(m.outcome);
  BOOST_CHECK(!m.early_resolution);
  BOOST_CHECK_EQUAL(m.resolved_at, DEADLINE);
}

BOOST_AUTO_TEST_CASE(resolve_happens_once) {
  engine.resolve_market(as("oracle", DEADLINE + 1), market, false);
  BOOST_CHECK_THROW(engine.resolve_market(as("oracle", DEADLINE + 2), market, true),
                    protocol::StateConflictError);
  BOOST_CHECK(!engine.get_market(market).outcome);
}

BOOST_AUTO_TEST_CASE(no_trading_after_resolution) {
  engine.buy(as("bob"), market, true, units::wad(5));
  engine.resolve_market(as("oracle", DEADLINE), market, true);
  BOOST_CHECK_THROW(engine.buy(as("bob"), market, true, units::wad(1)),
                    protocol::StateConflictError);
  BOOST_CHECK_THROW(engine.sell(as("bob"), market, true, units::wad(1)),
                    protocol::StateConflictError);
}

// =============================================================================
// Test 4: 兑付
// =============================================================================

BOOST_AUTO_TEST_CASE(winner_receives_one_unit_per_share) {
  engine.buy(as("alice"), market, true, units::wad(10));
  engine.buy(as("bob"), market, false, units::wad(10));
  // 两侧等量时托管至少覆盖一侧的全部兑付
  BOOST_CHECK(engine.market_escrow(market) >= units::usdc(10));

  BOOST_CHECK_THROW(engine.claim_winnings(as("alice"), market), protocol::StateConflictError);
  engine.resolve_market(as("oracle", DEADLINE), market, true);

  Amount before = usdc_of("alice");
  BOOST_CHECK_EQUAL(engine.claimable_winnings(market, "alice"), units::usdc(10));
  BOOST_CHECK_EQUAL(engine.claim_winnings(as("alice", DEADLINE), market), units::usdc(10));
  BOOST_CHECK_EQUAL(usdc_of("alice"), before + units::usdc(10));
  BOOST_CHECK_EQUAL(engine.position(market, "alice").yes, 0);
  BOOST_CHECK_EQUAL(engine.get_market(market).yes_shares, 0);

  // 已兑付后再次领取为 0
  BOOST_CHECK_EQUAL(engine.claim_winnings(as("alice", DEADLINE), market), 0);
}

BOOST_AUTO_TEST_CASE(loser_claim_is_a_no_op) {
  engine.buy(as("alice"), market, true, units::wad(10));
  engine.buy(as("bob"), market, false, units::wad(10));
  engine.resolve_market(as("oracle", DEADLINE), market, true);

  int64_t head = engine.head_seq();
  Amount before = usdc_of("bob");
  BOOST_CHECK_EQUAL(engine.claimable_winnings(market, "bob"), 0);
  BOOST_CHECK_EQUAL(engine.claim_winnings(as("bob", DEADLINE), market), 0);
  BOOST_CHECK_EQUAL(engine.head_seq(), head);
  BOOST_CHECK_EQUAL(usdc_of("bob"), before);
  BOOST_CHECK_EQUAL(engine.position(market, "bob").no, units::wad(10));
}

// =============================================================================
// Test 5: 转账 / 补足
// =============================================================================

BOOST_AUTO_TEST_CASE(outcome_tokens_transfer) {
  engine.buy(as("alice"), market, true, units::wad(10));
  engine.transfer_outcome(as("alice"), market, true, "carol", units::wad(4));
  BOOST_CHECK_EQUAL(engine.position(market, "alice").yes, units::wad(6));
  BOOST_CHECK_EQUAL(engine.position(market, "carol").yes, units::wad(4));
  BOOST_CHECK_EQUAL(engine.get_market(market).yes_shares, units::wad(10));

  BOOST_CHECK_THROW(engine.transfer_outcome(as("alice"), market, true, "carol", units::wad(7)),
                    protocol::InsufficientSharesError);
  BOOST_CHECK_THROW(engine.transfer_outcome(as("alice"), market, false, "carol", units::wad(1)),
                    protocol::InsufficientSharesError);
  BOOST_CHECK_THROW(engine.transfer_outcome(as("alice"), market, true, "alice", units::wad(1)),
                    protocol::ValidationError);

  // 接收方可以卖出
  BOOST_CHECK(engine.sell(as("carol"), market, true, units::wad(4)) > 0);
}

BOOST_AUTO_TEST_CASE(shortfall_requires_funding) {
  engine.buy(as("alice"), market, true, units::wad(10));
  engine.resolve_market(as("oracle", DEADLINE), market, true);
  BOOST_REQUIRE(engine.market_escrow(market) < units::usdc(10));

  BOOST_CHECK_THROW(engine.claim_winnings(as("alice", DEADLINE), market),
                    protocol::InsufficientFundsError);
  BOOST_CHECK_EQUAL(engine.position(market, "alice").yes, units::wad(10));

  BOOST_CHECK_THROW(engine.fund_market(as("backstop"), market, 0), protocol::ValidationError);
  engine.fund_market(as("backstop"), market, units::usdc(10));
  BOOST_CHECK_EQUAL(engine.claim_winnings(as("alice", DEADLINE), market), units::usdc(10));
}

BOOST_AUTO_TEST_SUITE_END()
