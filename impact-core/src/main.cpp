#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "api/api_server.hpp"
#include "core/config.hpp"
#include "core/database.hpp"
#include "ledger/event_store.hpp"
#include "monitor/deadline_monitor.hpp"
#include "protocol/engine.hpp"

void print_usage(const char *prog) {
  std::cout << "用法: " << prog << " --config <config.json> [--ephemeral]" << std::endl;
  std::cout << "  --ephemeral  事件只保存在内存中, 退出即丢弃" << std::endl;
}

int run(const std::string &config_path, bool ephemeral) {
  Config config = Config::load(config_path);

  std::cout << "[Main] DB Path: " << (ephemeral ? "(memory)" : config.db_path) << std::endl;
  std::cout << "[Main] API Port: " << config.api_port << std::endl;
  std::cout << "[Main] Admin: " << config.admin << ", Oracles: " << config.oracles.size() << std::endl;
  std::cout << "[Main] Yield Policy: " << config.yield_policy << std::endl;
  std::cout << "[Main] Completion Requires Target Date: "
            << (config.completion_requires_target_date ? "yes" : "no")
            << ", Auto Fail Overdue: " << (config.auto_fail_overdue ? "yes" : "no") << std::endl;

  std::unique_ptr<ledger::EventStore> store;
  if (ephemeral) {
    store = std::make_unique<ledger::MemoryEventStore>();
  } else {
    auto db = std::make_unique<Database>(config.db_path);
    db->init_schema();
    std::cout << "[Main] 事件日志: " << db->get_event_count() << " 条, last_seq=" << db->get_last_seq()
              << std::endl;
    store = std::move(db);
  }

  protocol::Engine engine(*store, protocol::EngineOptions::from_config(config));
  DeadlineMonitor monitor(config, engine);

  boost::asio::io_context api_ioc;
  ApiServer api_server(api_ioc, engine, static_cast<unsigned short>(config.api_port),
                       [&monitor]() { return monitor.status(); });

  boost::asio::signal_set signals(api_ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &, int) {
    std::cout << "\n[Main] 正在关闭..." << std::endl;
    api_ioc.stop();
  });

  // Monitor 使用单独的 io_context 和线程, 避免阻塞 API
  boost::asio::io_context monitor_ioc;
  monitor.start(monitor_ioc);
  std::thread monitor_thread([&monitor_ioc]() { monitor_ioc.run(); });

  std::cout << "[Main] 服务已启动" << std::endl;
  try {
    api_ioc.run();
  } catch (const std::exception &e) {
    std::cerr << "[Main] API 事件循环异常退出: " << e.what() << std::endl;
    monitor_ioc.stop();
    monitor_thread.join();
    throw;
  }

  std::cout << "[Main] 正在停止 Monitor..." << std::endl;
  monitor_ioc.stop();
  monitor_thread.join();

  std::cout << "[Main] 已退出, head_seq=" << engine.head_seq() << std::endl;
  return 0;
}

int main(int argc, char *argv[]) {
  std::string config_path = "config.json";
  bool ephemeral = false;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (std::strcmp(argv[i], "--ephemeral") == 0) {
      ephemeral = true;
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    }
  }

  std::cout << "========================================" << std::endl;
  std::cout << "    ImpactBond Core" << std::endl;
  std::cout << "========================================" << std::endl;

  try {
    return run(config_path, ephemeral);
  } catch (const std::exception &e) {
    std::cerr << "[Main] 启动失败: " << e.what() << std::endl;
    return 1;
  }
}
