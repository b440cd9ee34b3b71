#pragma once

// ============================================================================
// OracleAggregator - 里程碑验证驱动项目状态和市场结算
// ============================================================================
// 自身不持有状态; 所有写操作先检查 oracle 角色, 再做任何查找
//
// 完成: 最后一个里程碑验证通过 (且按策略已到最终目标日期)
//       -> 项目 Completed + 市场提前结算 YES, 同一批次提交
// 失败: markProjectFailed 或 (开启时) 最终里程碑逾期
//       -> 项目 Failed + 市场提前结算 NO, 同一批次提交

#include <string>
#include <vector>

#include "../ledger/ledger_types.hpp"
#include "access_control.hpp"
#include "errors.hpp"
#include "ports.hpp"
#include "project_registry.hpp"
#include "types.hpp"

namespace protocol {

struct OraclePolicy {
  // true: 只有到达最终里程碑目标日期后才会完成项目
  bool completion_requires_target_date = true;
  // true: 最终里程碑逾期 (加宽限期) 未全部验证时自动失败
  bool auto_fail_overdue = false;
  int64_t overdue_grace_seconds = 0;
  int min_milestones = 1;
};

struct SweepItem {
  std::string project_id;
  bool complete = false; // false 表示逾期失败
};

class OracleAggregator {
public:
  static constexpr const char *OVERDUE_REASON = "final milestone overdue";

  OracleAggregator(const AccessControl &access, const ProjectRegistry &registry,
                   const MarketResolver &markets, OraclePolicy policy)
      : access_(access), registry_(registry), markets_(markets), policy_(policy) {}

  const OraclePolicy &policy() const { return policy_; }

  void plan_setup_milestones(ledger::Batch &batch, const std::string &project_id,
                             const std::vector<std::string> &descriptions,
                             const std::vector<int64_t> &target_dates) const {
    access_.require(batch.caller(), Role::Oracle);
    registry_.plan_setup_milestones(batch, project_id, descriptions, target_dates,
                                    policy_.min_milestones);
  }

  // 返回本次调用是否完成了项目
  bool plan_verify(ledger::Batch &batch, const std::string &project_id, int index, bool verified,
                   const std::string &evidence_uri, const std::vector<std::string> &data_sources,
                   int confidence) const {
    access_.require(batch.caller(), Role::Oracle);
    bool all_done = registry_.plan_verify(batch, project_id, index, verified, evidence_uri,
                                          data_sources, confidence);
    if (!all_done || !completion_due(project_id, batch.now()))
      return false;
    plan_complete(batch, project_id);
    return true;
  }

  void plan_mark_failed(ledger::Batch &batch, const std::string &project_id,
                        const std::string &reason) const {
    access_.require(batch.caller(), Role::Oracle);
    if (reason.empty())
      throw ValidationError("Failure reason required");
    plan_fail(batch, project_id, reason);
  }

  // 全部验证通过但验证时尚未到目标日期的项目, 到期后由此完成
  void plan_finalize(ledger::Batch &batch, const std::string &project_id) const {
    access_.require(batch.caller(), Role::Oracle);
    const Project &p = registry_.get(project_id);
    if (is_terminal(p.status))
      throw StateConflictError("Project " + project_id + " is " + status_name(p.status));
    if (!eligible_for_completion(project_id, batch.now()))
      throw StateConflictError("Project " + project_id + " is not eligible for completion");
    plan_complete(batch, project_id);
  }

  // 列出本轮需要处理的项目, 每个项目单独提交
  std::vector<SweepItem> sweep_candidates(const ledger::Tx &tx) const {
    access_.require(tx.caller, Role::Oracle);
    std::vector<SweepItem> out;
    for (const auto &p : registry_.all()) {
      if (is_terminal(p.status))
        continue;
      const auto &list = registry_.milestones(p.id);
      if (list.empty())
        continue;
      if (eligible_for_completion(p.id, tx.now)) {
        out.push_back({p.id, true});
      } else if (policy_.auto_fail_overdue && overdue(p.id, tx.now)) {
        out.push_back({p.id, false});
      }
    }
    return out;
  }

  void plan_sweep_item(ledger::Batch &batch, const SweepItem &item) const {
    if (item.complete)
      plan_finalize(batch, item.project_id);
    else
      plan_mark_failed(batch, item.project_id, OVERDUE_REASON);
  }

  ProjectProgress progress(const std::string &project_id) const {
    return registry_.progress(project_id);
  }

private:
  int64_t final_target_date(const std::string &project_id) const {
    return registry_.milestones(project_id).back().target_date;
  }

  bool completion_due(const std::string &project_id, int64_t now) const {
    return !policy_.completion_requires_target_date || now >= final_target_date(project_id);
  }

  bool eligible_for_completion(const std::string &project_id, int64_t now) const {
    auto prog = registry_.progress(project_id);
    return prog.total > 0 && prog.completed == prog.total && completion_due(project_id, now);
  }

  bool overdue(const std::string &project_id, int64_t now) const {
    auto prog = registry_.progress(project_id);
    return prog.completed < prog.total &&
           now > final_target_date(project_id) + policy_.overdue_grace_seconds;
  }

  void plan_complete(ledger::Batch &batch, const std::string &project_id) const {
    registry_.plan_status_change(batch, project_id, ProjectStatus::Completed,
                                 "all milestones verified");
    markets_.plan_early_resolve(batch, project_id, true);
  }

  void plan_fail(ledger::Batch &batch, const std::string &project_id,
                 const std::string &reason) const {
    const Project &p = registry_.get(project_id);
    if (is_terminal(p.status))
      throw StateConflictError("Project " + project_id + " is " + status_name(p.status));
    batch.emit(ledger::EventType::ProjectMarkedFailed, project_id,
               {{"project_id", project_id}, {"reason", reason}});
    registry_.plan_status_change(batch, project_id, ProjectStatus::Failed, reason);
    markets_.plan_early_resolve(batch, project_id, false);
  }

  const AccessControl &access_;
  const ProjectRegistry &registry_;
  const MarketResolver &markets_;
  OraclePolicy policy_;
};

} // namespace protocol
