// ============================================================================
// YieldDistributor 测试
// ============================================================================
//
// Tests:
//   1. 按持仓比例领取 (remaining_pool)
//   2. 多次领取收敛, 总领取不超过存入
//   3. 存入 / 领取的错误路径
//   4. 持仓实时计算, 转账不做快照
//   5. APY
//   6. cumulative 策略
//
// ============================================================================

#include <boost/test/unit_test.hpp>

#include "protocol/collateral_vault.hpp"
#include "protocol/errors.hpp"
#include "protocol/yield_distributor.hpp"
#include "test_fixtures.hpp"

using namespace fixtures;

namespace {

// A 持有 300, B 持有 700, 项目已 Active
struct FundedProjectSetup : EngineSetup {
  explicit FundedProjectSetup(protocol::EngineOptions options = default_options())
      : EngineSetup(std::move(options)) {
    id = funding_project(1000, 1);
    fund("alice", 300);
    fund("bob", 700);
    engine.purchase_bonds(as("alice"), id, units::usdc(300));
    engine.purchase_bonds(as("bob"), id, units::usdc(700));
    fund("sponsor", 5000);
  }

  std::string id;
};

protocol::EngineOptions cumulative_options() {
  auto o = default_options();
  o.yield_policy = protocol::YieldPolicy::Cumulative;
  return o;
}

struct CumulativeSetup : FundedProjectSetup {
  CumulativeSetup() : FundedProjectSetup(cumulative_options()) {}
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(yield_tests, FundedProjectSetup)

// =============================================================================
// Test 1: 按比例
// =============================================================================

BOOST_AUTO_TEST_CASE(claimable_is_pro_rata) {
  engine.deposit_revenue(as("sponsor"), id, units::usdc(1000));
  BOOST_CHECK_EQUAL(engine.claimable_yield(id, "alice"), units::usdc(300));
  BOOST_CHECK_EQUAL(engine.claimable_yield(id, "bob"), units::usdc(700));
  BOOST_CHECK_EQUAL(engine.claimable_yield(id, "carol"), 0);

  BOOST_CHECK_EQUAL(engine.collateral_balance(protocol::CollateralVault::yield_escrow(id)),
                    units::usdc(1000));
  auto info = engine.yield_info(id, T0);
  BOOST_CHECK_EQUAL(info.total_revenue, units::usdc(1000));
  BOOST_CHECK_EQUAL(info.distributed, 0);
}

BOOST_AUTO_TEST_CASE(claim_pays_holder_and_updates_pool) {
  engine.deposit_revenue(as("sponsor"), id, units::usdc(1000));

  Amount paid = engine.claim_yield(as("alice", T0 + 100), id);
  BOOST_CHECK_EQUAL(paid, units::usdc(300));
  BOOST_CHECK_EQUAL(usdc_of("alice"), units::usdc(300));
  BOOST_CHECK_EQUAL(engine.last_claim_time(id, "alice"), T0 + 100);
  BOOST_CHECK_EQUAL(engine.holder_yield(id, "alice").total_claimed, units::usdc(300));
  BOOST_CHECK_EQUAL(engine.yield_info(id, T0 + 100).distributed, units::usdc(300));

  // remaining_pool: B 按剩余池子 700 的 70% 计算
  BOOST_CHECK_EQUAL(engine.claimable_yield(id, "bob"), units::usdc(490));
}

// 目标 50,000, 价格 10: 2,000 / 3,000 bonds, 5,000 收益按 40% / 60% 分配
BOOST_AUTO_TEST_CASE(two_holder_five_thousand_split) {
  auto other = funding_project(50000, 10);
  fund("dave", 20000);
  fund("erin", 30000);
  engine.purchase_bonds(as("dave"), other, units::usdc(20000));
  engine.purchase_bonds(as("erin"), other, units::usdc(30000));
  BOOST_CHECK_EQUAL(engine.bond_balance(other, "dave"), units::wad(2000));
  BOOST_CHECK_EQUAL(engine.bond_balance(other, "erin"), units::wad(3000));
  BOOST_CHECK(engine.get_project(other).status == protocol::ProjectStatus::Active);

  engine.deposit_revenue(as("sponsor"), other, units::usdc(5000));
  BOOST_CHECK_EQUAL(engine.claimable_yield(other, "dave"), units::usdc(2000));
  BOOST_CHECK_EQUAL(engine.claimable_yield(other, "erin"), units::usdc(3000));

  BOOST_CHECK_EQUAL(engine.claim_yield(as("dave"), other), units::usdc(2000));
  BOOST_CHECK_EQUAL(usdc_of("dave"), units::usdc(2000));
}

// =============================================================================
// Test 2: 收敛
// =============================================================================

BOOST_AUTO_TEST_CASE(repeated_claims_never_exceed_deposit) {
  engine.deposit_revenue(as("sponsor"), id, units::usdc(1000));

  Amount total = 0;
  for (int round = 0; round < 64; ++round) {
    bool any = false;
    for (const char *holder : {"alice", "bob"}) {
      if (engine.claimable_yield(id, holder) > 0) {
        total += engine.claim_yield(as(holder), id);
        any = true;
      }
    }
    if (!any)
      break;
  }

  BOOST_CHECK(total <= units::usdc(1000));
  BOOST_CHECK(units::usdc(1000) - total < units::USDC);
  BOOST_CHECK_EQUAL(engine.yield_info(id, T0).distributed, total);
  BOOST_CHECK_EQUAL(engine.collateral_balance(protocol::CollateralVault::yield_escrow(id)),
                    units::usdc(1000) - total);
}

// =============================================================================
// Test 3: 错误路径
// =============================================================================

BOOST_AUTO_TEST_CASE(nothing_to_claim) {
  BOOST_CHECK_THROW(engine.claim_yield(as("alice"), id), protocol::StateConflictError);
  engine.deposit_revenue(as("sponsor"), id, units::usdc(10));
  BOOST_CHECK_THROW(engine.claim_yield(as("carol"), id), protocol::StateConflictError);
  BOOST_CHECK_EQUAL(engine.last_claim_time(id, "carol"), 0);
}

BOOST_AUTO_TEST_CASE(deposit_rules) {
  BOOST_CHECK_THROW(engine.deposit_revenue(as("sponsor"), id, 0), protocol::ValidationError);
  BOOST_CHECK_THROW(engine.deposit_revenue(as("sponsor"), "prj-000099", units::usdc(1)),
                    protocol::NotFoundError);
  BOOST_CHECK_THROW(engine.deposit_revenue(as("nobody"), id, units::usdc(1)),
                    protocol::InsufficientFundsError);
  BOOST_CHECK_THROW(engine.claim_yield(as("alice"), "prj-000099"), protocol::NotFoundError);

  auto no_bond = engine.register_project(as("sponsor"), "N", "ipfs://n", units::usdc(10),
                                         units::usdc(1));
  BOOST_CHECK_THROW(engine.deposit_revenue(as("sponsor"), no_bond, units::usdc(1)),
                    protocol::NotFoundError);
  BOOST_CHECK_EQUAL(usdc_of("sponsor"), units::usdc(5000));
}

// =============================================================================
// Test 4: 转账后的比例
// =============================================================================

BOOST_AUTO_TEST_CASE(transfer_moves_claim_rights) {
  engine.deposit_revenue(as("sponsor"), id, units::usdc(1000));
  engine.transfer_bonds(as("alice"), id, "carol", units::wad(300));

  BOOST_CHECK_EQUAL(engine.claimable_yield(id, "alice"), 0);
  BOOST_CHECK_EQUAL(engine.claimable_yield(id, "carol"), units::usdc(300));
  BOOST_CHECK_EQUAL(engine.claim_yield(as("carol"), id), units::usdc(300));
}

// =============================================================================
// Test 5: APY
// =============================================================================

BOOST_AUTO_TEST_CASE(apy_from_distributed_yield) {
  engine.deposit_revenue(as("sponsor"), id, units::usdc(1000));
  BOOST_CHECK_EQUAL(engine.yield_info(id, T0 + 365 * DAY).apy_bps, 0);

  engine.claim_yield(as("alice", T0 + DAY), id);
  // 300 / 1000 一年 = 30%
  BOOST_CHECK_EQUAL(engine.yield_info(id, T0 + 365 * DAY).apy_bps, 3000);
  // 半年 = 60%
  BOOST_CHECK_EQUAL(engine.yield_info(id, T0 + 365 * DAY / 2).apy_bps, 6000);
  // 创建时刻不计算
  BOOST_CHECK_EQUAL(engine.yield_info(id, T0).apy_bps, 0);
}

BOOST_AUTO_TEST_SUITE_END()

// =============================================================================
// Test 6: cumulative 策略
// =============================================================================

BOOST_FIXTURE_TEST_SUITE(cumulative_yield_tests, CumulativeSetup)

BOOST_AUTO_TEST_CASE(sequential_claims_split_exactly) {
  engine.deposit_revenue(as("sponsor"), id, units::usdc(1000));
  BOOST_CHECK_EQUAL(engine.claim_yield(as("alice"), id), units::usdc(300));
  BOOST_CHECK_EQUAL(engine.claimable_yield(id, "bob"), units::usdc(700));
  BOOST_CHECK_EQUAL(engine.claim_yield(as("bob"), id), units::usdc(700));
  BOOST_CHECK_EQUAL(engine.yield_info(id, T0).distributed, units::usdc(1000));
  BOOST_CHECK_THROW(engine.claim_yield(as("alice"), id), protocol::StateConflictError);
}

BOOST_AUTO_TEST_CASE(later_deposit_adds_entitlement) {
  engine.deposit_revenue(as("sponsor"), id, units::usdc(1000));
  engine.claim_yield(as("alice"), id);

  engine.deposit_revenue(as("sponsor"), id, units::usdc(500));
  BOOST_CHECK_EQUAL(engine.yield_info(id, T0).total_revenue, units::usdc(1500));
  BOOST_CHECK_EQUAL(engine.claimable_yield(id, "alice"), units::usdc(150));
  BOOST_CHECK_EQUAL(engine.claimable_yield(id, "bob"), units::usdc(1050));
}

BOOST_AUTO_TEST_SUITE_END()
