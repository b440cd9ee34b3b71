#pragma once

// ============================================================================
// 组件之间的窄接口
// ============================================================================
// 组件只通过这些接口单向调用, 不持有对方的完整引用

#include <string>

#include "../core/amount.hpp"
#include "../ledger/ledger_types.hpp"
#include "types.hpp"

namespace protocol {

// Registry 对外提供的只读项目查询
class ProjectDirectory {
public:
  virtual ~ProjectDirectory() = default;
  virtual const Project *find_project(const std::string &project_id) const = 0;
};

// BondLedger -> Registry: 记录募资, 达标时切换到 Active
class FundingRecorder {
public:
  virtual ~FundingRecorder() = default;
  virtual void plan_record_funding(ledger::Batch &batch, const std::string &project_id,
                                   const Amount &delta) const = 0;
};

// OracleAggregator -> MarketBook: 项目完成/失败时提前结算市场
class MarketResolver {
public:
  virtual ~MarketResolver() = default;
  virtual void plan_early_resolve(ledger::Batch &batch, const std::string &project_id,
                                  bool outcome) const = 0;
};

} // namespace protocol
