#pragma once

#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct Config {
  std::string db_path;
  int api_port = 0;
  std::string admin;
  std::vector<std::string> oracles;
  // DeadlineMonitor 使用的 oracle 身份, 为空时不启动
  std::string system_oracle;
  int64_t default_liquidity = 1000; // 整数 share, 乘 1e18 后作为 LMSR b
  int min_milestones = 1;
  bool completion_requires_target_date = true;
  bool auto_fail_overdue = false;
  int64_t overdue_grace_seconds = 0;
  int sweep_interval_seconds = 60;
  std::string yield_policy = "remaining_pool";

  static Config load(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open())
      throw std::runtime_error("无法打开配置文件: " + path);

    json j;
    f >> j;
    return from_json(j);
  }

  static Config from_json(const json &j) {
    auto require = [&](const char *key) -> const json & {
      if (!j.contains(key))
        throw std::runtime_error(std::string("配置文件缺少必填字段: ") + key);
      return j.at(key);
    };

    Config config;
    config.db_path = require("db_path").get<std::string>();
    config.api_port = require("api_port").get<int>();
    config.admin = require("admin").get<std::string>();
    config.oracles = j.value("oracles", std::vector<std::string>{});
    config.system_oracle = j.value("system_oracle", std::string{});
    config.default_liquidity = j.value("default_liquidity", config.default_liquidity);
    config.min_milestones = j.value("min_milestones", config.min_milestones);
    config.completion_requires_target_date =
        j.value("completion_requires_target_date", config.completion_requires_target_date);
    config.auto_fail_overdue = j.value("auto_fail_overdue", config.auto_fail_overdue);
    config.overdue_grace_seconds = j.value("overdue_grace_seconds", config.overdue_grace_seconds);
    config.sweep_interval_seconds =
        j.value("sweep_interval_seconds", config.sweep_interval_seconds);
    config.yield_policy = j.value("yield_policy", config.yield_policy);

    if (config.admin.empty())
      throw std::runtime_error("admin 不能为空");
    if (config.default_liquidity <= 0)
      throw std::runtime_error("default_liquidity 必须 > 0");
    if (config.min_milestones < 1)
      throw std::runtime_error("min_milestones 必须 >= 1");
    if (config.sweep_interval_seconds < 1)
      throw std::runtime_error("sweep_interval_seconds 必须 >= 1");
    return config;
  }
};
