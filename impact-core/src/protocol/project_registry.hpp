#pragma once

// ============================================================================
// ProjectRegistry - 项目与里程碑的权威记录
// ============================================================================
// 1. 项目: 注册 -> 状态机迁移 (只能由 oracle 或内部回调驱动)
// 2. 募资: 只接受 BondLedger 通过 FundingRecorder 回调, 达标时 Funding -> Active
// 3. 里程碑: 只设置一次, 之后只能 pending -> completed
// 4. 验证记录: 每次 verifyMilestone 追加一条, 无论结果

#include <cstdio>
#include <map>
#include <string>
#include <vector>

#include "../ledger/ledger_types.hpp"
#include "access_control.hpp"
#include "errors.hpp"
#include "ports.hpp"
#include "types.hpp"

namespace protocol {

class ProjectRegistry : public ProjectDirectory, public FundingRecorder {
public:
  explicit ProjectRegistry(const AccessControl &access) : access_(access) {}

  // ==========================================================================
  // 查询
  // ==========================================================================

  const Project *find_project(const std::string &project_id) const override {
    auto it = projects_.find(project_id);
    return it == projects_.end() ? nullptr : &it->second;
  }

  const Project &get(const std::string &project_id) const {
    const Project *p = find_project(project_id);
    if (!p)
      throw NotFoundError("Project not found: " + project_id);
    return *p;
  }

  std::vector<Project> all() const {
    std::vector<Project> out;
    out.reserve(order_.size());
    for (const auto &id : order_)
      out.push_back(projects_.at(id));
    return out;
  }

  // Funding 或 Active
  std::vector<Project> active() const {
    std::vector<Project> out;
    for (const auto &id : order_) {
      const auto &p = projects_.at(id);
      if (p.status == ProjectStatus::Funding || p.status == ProjectStatus::Active)
        out.push_back(p);
    }
    return out;
  }

  size_t count() const { return order_.size(); }

  const std::vector<Milestone> &milestones(const std::string &project_id) const {
    get(project_id);
    auto it = milestones_.find(project_id);
    return it == milestones_.end() ? empty_milestones_ : it->second;
  }

  const Milestone &milestone(const std::string &project_id, int index) const {
    const auto &list = milestones(project_id);
    if (list.empty())
      throw NotFoundError("Milestones not setup for project " + project_id);
    if (index < 0 || index >= static_cast<int>(list.size()))
      throw NotFoundError("Invalid milestone index " + std::to_string(index));
    return list[index];
  }

  const std::vector<VerificationRecord> &verifications(const std::string &project_id) const {
    get(project_id);
    auto it = verifications_.find(project_id);
    return it == verifications_.end() ? empty_verifications_ : it->second;
  }

  ProjectProgress progress(const std::string &project_id) const {
    ProjectProgress out;
    for (const auto &m : milestones(project_id)) {
      ++out.total;
      if (m.completed)
        ++out.completed;
    }
    return out;
  }

  // ==========================================================================
  // 规划 (只校验, 不修改状态)
  // ==========================================================================

  std::string plan_register(ledger::Batch &batch, const std::string &name,
                            const std::string &metadata_uri, const Amount &funding_goal,
                            const Amount &bond_price) const {
    if (batch.caller().empty())
      throw ValidationError("Sponsor required");
    if (name.empty())
      throw ValidationError("Name required");
    if (metadata_uri.empty())
      throw ValidationError("MetadataURI required");
    if (funding_goal <= 0)
      throw ValidationError("Funding goal must be > 0");
    if (bond_price <= 0)
      throw ValidationError("Bond price must be > 0");

    Project p;
    p.id = next_project_id();
    p.sponsor = batch.caller();
    p.name = name;
    p.metadata_uri = metadata_uri;
    p.funding_goal = funding_goal;
    p.bond_price = bond_price;
    p.status = ProjectStatus::Pending;
    p.created_at = batch.now();

    batch.emit(ledger::EventType::ProjectRegistered, p.id, json(p));
    return p.id;
  }

  // 外部入口, 仅 oracle. 终态只能经 OracleAggregator 进入, 市场在同一批次结算
  void plan_update_status(ledger::Batch &batch, const std::string &project_id,
                          ProjectStatus to) const {
    access_.require(batch.caller(), Role::Oracle);
    if (is_terminal(to))
      throw ValidationError(std::string("Status ") + status_name(to) +
                            " is set by milestone verification or mark_project_failed");
    plan_status_change(batch, project_id, to, "");
  }

  void plan_status_change(ledger::Batch &batch, const std::string &project_id, ProjectStatus to,
                          const std::string &reason) const {
    const Project &p = get(project_id);
    if (!can_transition(p.status, to))
      throw StateConflictError(std::string("Invalid status transition ") + status_name(p.status) +
                               " -> " + status_name(to) + " for " + project_id);
    batch.emit(ledger::EventType::ProjectStatusChanged, project_id,
               {{"project_id", project_id}, {"from", p.status}, {"to", to}, {"reason", reason}});
  }

  void plan_record_funding(ledger::Batch &batch, const std::string &project_id,
                           const Amount &delta) const override {
    const Project &p = get(project_id);
    Amount raised = p.funding_raised + delta;
    batch.emit(ledger::EventType::ProjectFunded, project_id,
               {{"project_id", project_id}, {"delta", delta}, {"funding_raised", raised}});
    if (p.status == ProjectStatus::Funding && raised >= p.funding_goal)
      plan_status_change(batch, project_id, ProjectStatus::Active, "funding goal reached");
  }

  void plan_setup_milestones(ledger::Batch &batch, const std::string &project_id,
                             const std::vector<std::string> &descriptions,
                             const std::vector<int64_t> &target_dates, int min_count) const {
    const Project &p = get(project_id);
    if (descriptions.size() != target_dates.size())
      throw ValidationError("Invalid array lengths");
    if (descriptions.empty() || static_cast<int>(descriptions.size()) < min_count)
      throw ValidationError("At least " + std::to_string(min_count) + " milestone(s) required");
    if (is_terminal(p.status))
      throw StateConflictError("Project " + project_id + " is " + status_name(p.status));
    if (milestones_.contains(project_id))
      throw StateConflictError("Milestones already setup for " + project_id);

    json list = json::array();
    for (size_t i = 0; i < descriptions.size(); ++i) {
      if (descriptions[i].empty())
        throw ValidationError("Milestone " + std::to_string(i) + " description required");
      if (target_dates[i] <= 0)
        throw ValidationError("Milestone " + std::to_string(i) + " target date required");
      list.push_back({{"description", descriptions[i]}, {"target_date", target_dates[i]}});
    }
    batch.emit(ledger::EventType::MilestonesSetup, project_id,
               {{"project_id", project_id}, {"count", list.size()}, {"milestones", list}});
  }

  // 返回本次验证后是否全部完成
  bool plan_verify(ledger::Batch &batch, const std::string &project_id, int index, bool verified,
                   const std::string &evidence_uri, const std::vector<std::string> &data_sources,
                   int confidence) const {
    const Project &p = get(project_id);
    const Milestone &m = milestone(project_id, index);
    if (confidence < 0 || confidence > 100)
      throw ValidationError("Invalid confidence " + std::to_string(confidence));
    if (is_terminal(p.status))
      throw StateConflictError("Project " + project_id + " is " + status_name(p.status));
    if (m.completed)
      throw StateConflictError("Milestone " + std::to_string(index) + " already completed");

    batch.emit(ledger::EventType::MilestoneVerified, project_id,
               {{"project_id", project_id},
                {"index", index},
                {"verified", verified},
                {"evidence_uri", evidence_uri},
                {"data_sources", data_sources},
                {"confidence", confidence},
                {"verifier", batch.caller()},
                {"at", batch.now()}});

    auto prog = progress(project_id);
    return verified && prog.completed + 1 == prog.total;
  }

  // ==========================================================================
  // 应用已提交事件
  // ==========================================================================

  void apply(const ledger::Event &e) {
    switch (e.type) {
    case ledger::EventType::ProjectRegistered: {
      Project p = e.payload.get<Project>();
      order_.push_back(p.id);
      projects_[p.id] = std::move(p);
      break;
    }
    case ledger::EventType::ProjectStatusChanged: {
      Project &p = mutable_project(e.project_id);
      p.status = e.payload.at("to").get<ProjectStatus>();
      if (p.status == ProjectStatus::Failed)
        p.failure_reason = e.payload.at("reason").get<std::string>();
      break;
    }
    case ledger::EventType::ProjectFunded:
      mutable_project(e.project_id).funding_raised = e.payload.at("funding_raised").get<Amount>();
      break;
    case ledger::EventType::BondCreated:
      mutable_project(e.project_id).bond_id = e.payload.at("bond_id").get<std::string>();
      break;
    case ledger::EventType::MarketCreated:
      mutable_project(e.project_id).market_id = e.payload.at("market_id").get<std::string>();
      break;
    case ledger::EventType::MilestonesSetup: {
      auto &list = milestones_[e.project_id];
      int index = 0;
      for (const auto &item : e.payload.at("milestones")) {
        Milestone m;
        m.project_id = e.project_id;
        m.index = index++;
        m.description = item.at("description").get<std::string>();
        m.target_date = item.at("target_date").get<int64_t>();
        list.push_back(std::move(m));
      }
      break;
    }
    case ledger::EventType::MilestoneVerified:
      apply_verification(e);
      break;
    default:
      break;
    }
  }

private:
  std::string next_project_id() const {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "prj-%06zu", order_.size() + 1);
    return buf;
  }

  Project &mutable_project(const std::string &project_id) {
    auto it = projects_.find(project_id);
    if (it == projects_.end())
      throw std::runtime_error("journal references unknown project " + project_id);
    return it->second;
  }

  void apply_verification(const ledger::Event &e) {
    VerificationRecord r;
    r.project_id = e.project_id;
    r.milestone_index = e.payload.at("index").get<int>();
    r.verified = e.payload.at("verified").get<bool>();
    r.evidence_uri = e.payload.at("evidence_uri").get<std::string>();
    r.data_sources = e.payload.at("data_sources").get<std::vector<std::string>>();
    r.confidence = e.payload.at("confidence").get<int>();
    r.timestamp = e.payload.at("at").get<int64_t>();
    r.verifier = e.payload.at("verifier").get<std::string>();

    if (r.verified) {
      Milestone &m = milestones_.at(e.project_id).at(r.milestone_index);
      m.completed = true;
      m.completed_at = r.timestamp;
      m.evidence_uri = r.evidence_uri;
      m.data_sources = r.data_sources;
      m.confidence = r.confidence;
    }
    verifications_[e.project_id].push_back(std::move(r));
  }

  const AccessControl &access_;
  std::map<std::string, Project> projects_;
  std::vector<std::string> order_;
  std::map<std::string, std::vector<Milestone>> milestones_;
  std::map<std::string, std::vector<VerificationRecord>> verifications_;
  const std::vector<Milestone> empty_milestones_;
  const std::vector<VerificationRecord> empty_verifications_;
};

} // namespace protocol
