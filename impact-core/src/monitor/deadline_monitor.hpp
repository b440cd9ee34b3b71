#pragma once

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include <boost/asio.hpp>

#include "../api/api_session.hpp"
#include "../core/config.hpp"
#include "../protocol/engine.hpp"

namespace asio = boost::asio;

// ============================================================================
// DeadlineMonitor - 定期扫描里程碑截止日期
// ============================================================================
// 以 system_oracle 身份调用 Engine::sweep_overdue:
//   - 已全部验证且到达最终目标日期的项目 -> Completed, 市场结算 YES
//   - 开启 auto_fail_overdue 时, 最终里程碑逾期的项目 -> Failed, 市场结算 NO
class DeadlineMonitor {
public:
  DeadlineMonitor(const Config &config, protocol::Engine &engine)
      : engine_(engine), oracle_(config.system_oracle),
        interval_seconds_(config.sweep_interval_seconds) {}

  bool enabled() const { return !oracle_.empty(); }

  void start(asio::io_context &ioc) {
    if (!enabled()) {
      std::cout << "[Monitor] 未配置 system_oracle, 不启动" << std::endl;
      return;
    }
    ioc_ = &ioc;
    is_sweeping_ = false;
    schedule_sweep(0);
  }

  MonitorStatus status() const {
    return {enabled(), is_sweeping_, last_sweep_at_, sweeps_, projects_closed_};
  }

private:
  void schedule_sweep(int delay_seconds) {
    auto timer = std::make_shared<asio::steady_timer>(*ioc_);
    timer->expires_after(std::chrono::seconds(delay_seconds));
    timer->async_wait([this, timer](boost::system::error_code ec) {
      if (!ec) {
        do_sweep();
      }
    });
  }

  void do_sweep() {
    is_sweeping_ = true;
    int64_t now = std::chrono::duration_cast<std::chrono::seconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();

    try {
      auto items = engine_.sweep_overdue({oracle_, now});
      for (const auto &item : items) {
        std::cout << "[Monitor] " << item.project_id << (item.complete ? " 已完成" : " 已逾期失败")
                  << std::endl;
      }
      projects_closed_ += static_cast<int64_t>(items.size());
    } catch (const protocol::ProtocolError &e) {
      std::cerr << "[Monitor] 扫描被拒绝 (" << protocol::error_kind_name(e.kind())
                << "): " << e.what() << std::endl;
    } catch (const std::exception &e) {
      std::cerr << "[Monitor] 扫描失败: " << e.what() << ", " << interval_seconds_ << "s 后重试"
                << std::endl;
    }

    last_sweep_at_ = now;
    ++sweeps_;
    is_sweeping_ = false;
    schedule_sweep(interval_seconds_);
  }

  protocol::Engine &engine_;
  std::string oracle_;
  asio::io_context *ioc_ = nullptr;

  int interval_seconds_;
  std::atomic<bool> is_sweeping_{false};
  std::atomic<int64_t> last_sweep_at_{0};
  std::atomic<int64_t> sweeps_{0};
  std::atomic<int64_t> projects_closed_{0};
};
