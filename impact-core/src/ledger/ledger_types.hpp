#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace ledger {

enum class EventType : uint8_t {
  RoleGranted = 0,
  RoleRevoked = 1,
  CollateralCredited = 2,
  CollateralTransferred = 3,
  ProjectRegistered = 4,
  ProjectStatusChanged = 5,
  ProjectFunded = 6,
  ProjectMarkedFailed = 7,
  BondCreated = 8,
  BondsPurchased = 9,
  BondsTransferred = 10,
  RevenueDeposited = 11,
  YieldClaimed = 12,
  MilestonesSetup = 13,
  MilestoneVerified = 14,
  MarketCreated = 15,
  SharesTraded = 16,
  OutcomeTransferred = 17,
  MarketFunded = 18,
  MarketResolved = 19,
  WinningsClaimed = 20,
};

inline const char *event_type_name(EventType type) {
  switch (type) {
  case EventType::RoleGranted: return "RoleGranted";
  case EventType::RoleRevoked: return "RoleRevoked";
  case EventType::CollateralCredited: return "CollateralCredited";
  case EventType::CollateralTransferred: return "CollateralTransferred";
  case EventType::ProjectRegistered: return "ProjectRegistered";
  case EventType::ProjectStatusChanged: return "ProjectStatusChanged";
  case EventType::ProjectFunded: return "ProjectFunded";
  case EventType::ProjectMarkedFailed: return "ProjectMarkedFailed";
  case EventType::BondCreated: return "BondCreated";
  case EventType::BondsPurchased: return "BondsPurchased";
  case EventType::BondsTransferred: return "BondsTransferred";
  case EventType::RevenueDeposited: return "RevenueDeposited";
  case EventType::YieldClaimed: return "YieldClaimed";
  case EventType::MilestonesSetup: return "MilestonesSetup";
  case EventType::MilestoneVerified: return "MilestoneVerified";
  case EventType::MarketCreated: return "MarketCreated";
  case EventType::SharesTraded: return "SharesTraded";
  case EventType::OutcomeTransferred: return "OutcomeTransferred";
  case EventType::MarketFunded: return "MarketFunded";
  case EventType::MarketResolved: return "MarketResolved";
  case EventType::WinningsClaimed: return "WinningsClaimed";
  }
  return "Unknown";
}

inline EventType event_type_from_name(const std::string &name) {
  for (uint8_t i = 0; i <= static_cast<uint8_t>(EventType::WinningsClaimed); ++i) {
    auto type = static_cast<EventType>(i);
    if (name == event_type_name(type))
      return type;
  }
  throw std::invalid_argument("unknown event type: " + name);
}

// 一条已提交的事件. seq 全局单调递增, 从 1 开始
struct Event {
  int64_t seq = 0;
  int64_t ts = 0;
  EventType type = EventType::RoleGranted;
  std::string project_id;
  json payload;
};

inline json to_json_row(const Event &e) {
  return {
      {"seq", e.seq},
      {"ts", e.ts},
      {"type", event_type_name(e.type)},
      {"project_id", e.project_id},
      {"payload", e.payload},
  };
}

// 调用上下文: 调用者身份 + 调用方提供的时间 (秒)
struct Tx {
  std::string caller;
  int64_t now = 0;
};

// 一次操作产生的全部事件, 原子提交
class Batch {
public:
  explicit Batch(Tx tx) : tx_(std::move(tx)) {}

  const Tx &tx() const { return tx_; }
  const std::string &caller() const { return tx_.caller; }
  int64_t now() const { return tx_.now; }

  void emit(EventType type, std::string project_id, json payload) {
    Event e;
    e.ts = tx_.now;
    e.type = type;
    e.project_id = std::move(project_id);
    e.payload = std::move(payload);
    events_.push_back(std::move(e));
  }

  bool empty() const { return events_.empty(); }
  size_t size() const { return events_.size(); }
  const std::vector<Event> &events() const { return events_; }
  std::vector<Event> take() { return std::move(events_); }

private:
  Tx tx_;
  std::vector<Event> events_;
};

} // namespace ledger
