#pragma once

#include <mutex>
#include <stdexcept>
#include <vector>

#include "ledger_types.hpp"

namespace ledger {

// 事件日志存储. append 必须全有或全无
class EventStore {
public:
  virtual ~EventStore() = default;

  virtual std::vector<Event> load_all() = 0;
  virtual std::vector<Event> load_since(int64_t after_seq, size_t limit) = 0;
  virtual void append(const std::vector<Event> &events) = 0;
};

// 纯内存实现, 用于测试和 --ephemeral 模式
class MemoryEventStore : public EventStore {
public:
  std::vector<Event> load_all() override {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

  std::vector<Event> load_since(int64_t after_seq, size_t limit) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Event> out;
    for (const auto &e : events_) {
      if (e.seq <= after_seq)
        continue;
      if (out.size() >= limit)
        break;
      out.push_back(e);
    }
    return out;
  }

  void append(const std::vector<Event> &events) override {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t last = events_.empty() ? 0 : events_.back().seq;
    for (const auto &e : events) {
      if (e.seq <= last)
        throw std::runtime_error("event seq out of order: " + std::to_string(e.seq));
      last = e.seq;
    }
    events_.insert(events_.end(), events.begin(), events.end());
  }

  size_t size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
  }

private:
  std::mutex mutex_;
  std::vector<Event> events_;
};

} // namespace ledger
