#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "../ledger/ledger_types.hpp"
#include "errors.hpp"
#include "types.hpp"

namespace protocol {

// 身份 -> 角色集合
class AccessControl {
public:
  bool has_role(const std::string &account, Role role) const {
    auto it = roles_.find(account);
    return it != roles_.end() && it->second.contains(role);
  }

  void require(const std::string &account, Role role) const {
    if (!has_role(account, role))
      throw AuthorizationError("'" + account + "' lacks role " + role_name(role));
  }

  std::vector<std::string> members(Role role) const {
    std::vector<std::string> out;
    for (const auto &[account, set] : roles_) {
      if (set.contains(role))
        out.push_back(account);
    }
    return out;
  }

  void plan_grant(ledger::Batch &batch, Role role, const std::string &account) const {
    require(batch.caller(), Role::Admin);
    plan_bootstrap_grant(batch, role, account);
  }

  // 创世批次专用, 不检查调用者
  void plan_bootstrap_grant(ledger::Batch &batch, Role role, const std::string &account) const {
    if (account.empty())
      throw ValidationError("Invalid address");
    if (has_role(account, role))
      throw StateConflictError("'" + account + "' already has role " + role_name(role));
    batch.emit(ledger::EventType::RoleGranted, "",
               {{"role", role}, {"account", account}, {"granted_by", batch.caller()}});
  }

  void plan_revoke(ledger::Batch &batch, Role role, const std::string &account) const {
    require(batch.caller(), Role::Admin);
    if (account.empty())
      throw ValidationError("Invalid address");
    if (!has_role(account, role))
      throw StateConflictError("'" + account + "' does not have role " + role_name(role));
    batch.emit(ledger::EventType::RoleRevoked, "",
               {{"role", role}, {"account", account}, {"revoked_by", batch.caller()}});
  }

  void apply(const ledger::Event &e) {
    switch (e.type) {
    case ledger::EventType::RoleGranted:
      roles_[e.payload.at("account").get<std::string>()].insert(e.payload.at("role").get<Role>());
      break;
    case ledger::EventType::RoleRevoked:
      roles_[e.payload.at("account").get<std::string>()].erase(e.payload.at("role").get<Role>());
      break;
    default:
      break;
    }
  }

private:
  std::map<std::string, std::set<Role>> roles_;
};

} // namespace protocol
