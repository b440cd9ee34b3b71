#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../core/amount.hpp"
#include "errors.hpp"

using json = nlohmann::json;

namespace protocol {

// ============================================================================
// 项目状态机
// ============================================================================
// Pending -> Funding -> Active -> Completed
//     \________\__________\_____-> Failed
// Completed / Failed 为终态
enum class ProjectStatus : uint8_t {
  Pending = 0,
  Funding = 1,
  Active = 2,
  Completed = 3,
  Failed = 4,
};

NLOHMANN_JSON_SERIALIZE_ENUM(ProjectStatus, {
                                                {ProjectStatus::Pending, "Pending"},
                                                {ProjectStatus::Funding, "Funding"},
                                                {ProjectStatus::Active, "Active"},
                                                {ProjectStatus::Completed, "Completed"},
                                                {ProjectStatus::Failed, "Failed"},
                                            })

inline const char *status_name(ProjectStatus s) {
  switch (s) {
  case ProjectStatus::Pending: return "Pending";
  case ProjectStatus::Funding: return "Funding";
  case ProjectStatus::Active: return "Active";
  case ProjectStatus::Completed: return "Completed";
  case ProjectStatus::Failed: return "Failed";
  }
  return "Unknown";
}

inline ProjectStatus status_from_name(const std::string &name) {
  for (auto s : {ProjectStatus::Pending, ProjectStatus::Funding, ProjectStatus::Active,
                 ProjectStatus::Completed, ProjectStatus::Failed}) {
    if (name == status_name(s))
      return s;
  }
  throw ValidationError("unknown project status: " + name);
}

inline bool is_terminal(ProjectStatus s) {
  return s == ProjectStatus::Completed || s == ProjectStatus::Failed;
}

// 只允许向前迁移; 任何非终态都可以直接进入 Failed
inline bool can_transition(ProjectStatus from, ProjectStatus to) {
  if (is_terminal(from))
    return false;
  return static_cast<uint8_t>(to) > static_cast<uint8_t>(from);
}

enum class Role : uint8_t {
  Admin = 0,
  Oracle = 1,
};

NLOHMANN_JSON_SERIALIZE_ENUM(Role, {
                                       {Role::Admin, "admin"},
                                       {Role::Oracle, "oracle"},
                                   })

inline const char *role_name(Role r) { return r == Role::Admin ? "admin" : "oracle"; }

inline Role role_from_name(const std::string &name) {
  if (name == "admin")
    return Role::Admin;
  if (name == "oracle")
    return Role::Oracle;
  throw ValidationError("unknown role: " + name);
}

// ============================================================================
// 实体
// ============================================================================

struct Project {
  std::string id;
  std::string sponsor;
  std::string name;
  std::string metadata_uri;
  Amount funding_goal = 0;   // collateral 单位
  Amount funding_raised = 0; // 可能超过 funding_goal
  Amount bond_price = 0;     // 每 1e18 bond 的 collateral 价格
  ProjectStatus status = ProjectStatus::Pending;
  int64_t created_at = 0;
  std::string bond_id;
  std::string market_id;
  std::string failure_reason;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Project, id, sponsor, name, metadata_uri, funding_goal,
                                   funding_raised, bond_price, status, created_at, bond_id,
                                   market_id, failure_reason)

struct Milestone {
  std::string project_id;
  int index = 0;
  std::string description;
  int64_t target_date = 0;
  bool completed = false;
  int64_t completed_at = 0;
  std::string evidence_uri;
  std::vector<std::string> data_sources;
  int confidence = 0;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Milestone, project_id, index, description, target_date,
                                   completed, completed_at, evidence_uri, data_sources,
                                   confidence)

struct VerificationRecord {
  std::string project_id;
  int milestone_index = 0;
  bool verified = false;
  std::string evidence_uri;
  std::vector<std::string> data_sources;
  int confidence = 0;
  int64_t timestamp = 0;
  std::string verifier;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(VerificationRecord, project_id, milestone_index, verified,
                                   evidence_uri, data_sources, confidence, timestamp, verifier)

struct ProjectProgress {
  int completed = 0;
  int total = 0;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ProjectProgress, completed, total)

struct Bond {
  std::string bond_id;
  std::string project_id;
  int64_t created_at = 0;
  Amount total_supply = 0;
  Amount collateral_raised = 0;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Bond, bond_id, project_id, created_at, total_supply,
                                   collateral_raised)

struct YieldPool {
  std::string project_id;
  Amount total_deposited = 0;
  Amount total_distributed = 0;
};

struct HolderYield {
  int64_t last_claim_at = 0;
  Amount total_claimed = 0;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(HolderYield, last_claim_at, total_claimed)

struct YieldInfo {
  Amount total_revenue = 0;
  Amount distributed = 0;
  int64_t apy_bps = 0;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(YieldInfo, total_revenue, distributed, apy_bps)

struct Market {
  std::string id;
  std::string project_id;
  std::string question;
  int64_t resolution_time = 0;
  Amount liquidity = 0; // LMSR b, WAD
  Amount yes_shares = 0;
  Amount no_shares = 0;
  bool resolved = false;
  bool outcome = false;
  bool early_resolution = false;
  int64_t resolved_at = 0;
  int64_t created_at = 0;
  Amount volume = 0; // 累计成交 collateral
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Market, id, project_id, question, resolution_time, liquidity,
                                   yes_shares, no_shares, resolved, outcome, early_resolution,
                                   resolved_at, created_at, volume)

struct Position {
  Amount yes = 0;
  Amount no = 0;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Position, yes, no)

struct Trade {
  std::string market_id;
  std::string trader;
  bool is_yes = false;
  bool is_buy = false;
  Amount shares = 0;
  Amount collateral = 0;
  int64_t timestamp = 0;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Trade, market_id, trader, is_yes, is_buy, shares, collateral,
                                   timestamp)

} // namespace protocol
