#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <nlohmann/json.hpp>

#include "../protocol/engine.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;
using json = nlohmann::json;

struct MonitorStatus {
  bool enabled = false;
  bool is_sweeping = false;
  int64_t last_sweep_at = 0;
  int64_t sweeps = 0;
  int64_t projects_closed = 0;
};

class ApiSession : public std::enable_shared_from_this<ApiSession> {
public:
  using MonitorStatusGetter = std::function<MonitorStatus()>;

  ApiSession(tcp::socket socket, protocol::Engine &engine, MonitorStatusGetter monitor_getter = nullptr)
      : socket_(std::move(socket)), engine_(engine), monitor_getter_(std::move(monitor_getter)) {}

  void run() { do_read(); }

private:
  using Segments = std::vector<std::string>;

  void do_read() {
    req_ = {};
    http::async_read(socket_, buffer_, req_,
                     [self = shared_from_this()](beast::error_code ec, std::size_t) {
                       if (ec)
                         return;
                       self->handle_request();
                     });
  }

  void handle_request() {
    res_ = {};
    res_.version(req_.version());
    res_.keep_alive(req_.keep_alive());

    res_.set(http::field::access_control_allow_origin, "*");
    res_.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res_.set(http::field::access_control_allow_headers, "Content-Type, X-Caller");

    if (req_.method() == http::verb::options) {
      res_.result(http::status::ok);
      return do_write();
    }

    std::string target(req_.target());
    std::string path = target.substr(0, target.find('?'));

    try {
      Segments seg = split_path(path);
      if (path == "/api/health") {
        handle_health();
      } else if (seg.size() >= 2 && seg[0] == "api" && seg[1] == "projects") {
        is_post() ? post_projects(seg) : get_projects(seg);
      } else if (seg.size() >= 2 && seg[0] == "api" && seg[1] == "markets") {
        is_post() ? post_markets(seg) : get_markets(seg);
      } else if (path.starts_with("/api/collateral/")) {
        handle_collateral(seg);
      } else if (path.starts_with("/api/roles/")) {
        handle_roles(seg);
      } else if (path == "/api/events") {
        handle_events();
      } else {
        not_found();
      }
    } catch (const protocol::ProtocolError &e) {
      reply_error(status_for(e.kind()), protocol::error_kind_name(e.kind()), e.what());
    } catch (const json::exception &e) {
      reply_error(http::status::bad_request, "ValidationError", e.what());
    } catch (const std::invalid_argument &e) {
      reply_error(http::status::bad_request, "ValidationError", e.what());
    } catch (const std::overflow_error &e) {
      reply_error(http::status::bad_request, "ValidationError", e.what());
    } catch (const std::exception &e) {
      std::cerr << "[HTTP] " << req_.method_string() << " " << target << " 失败: " << e.what()
                << std::endl;
      reply_error(http::status::internal_server_error, "InternalError", e.what());
    }

    res_.prepare_payload();
    do_write();
  }

  // ==========================================================================
  // 路由
  // ==========================================================================

  void handle_health() {
    json result = {
        {"status", "ok"},
        {"head_seq", engine_.head_seq()},
        {"projects", engine_.project_count()},
        {"markets", engine_.market_count()},
    };
    if (monitor_getter_) {
      MonitorStatus s = monitor_getter_();
      result["monitor"] = {{"enabled", s.enabled},
                           {"is_sweeping", s.is_sweeping},
                           {"last_sweep_at", s.last_sweep_at},
                           {"sweeps", s.sweeps},
                           {"projects_closed", s.projects_closed}};
    }
    reply(result);
  }

  // GET /api/projects[/active | /{id}[/milestones[/{i}] | /verifications | /progress |
  //                                    /yield | /bond | /market | /bonds/{holder}]]
  void get_projects(const Segments &seg) {
    if (seg.size() == 2)
      return reply(json(engine_.all_projects()));
    if (seg.size() == 3 && seg[2] == "active")
      return reply(json(engine_.active_projects()));

    const std::string &id = seg[2];
    if (seg.size() == 3)
      return reply(json(engine_.get_project(id)));

    const std::string &what = seg[3];
    if (seg.size() == 4) {
      if (what == "milestones")
        return reply(json(engine_.milestones(id)));
      if (what == "verifications")
        return reply(json(engine_.verifications(id)));
      if (what == "progress")
        return reply(json(engine_.project_progress(id)));
      if (what == "yield")
        return reply(json(engine_.yield_info(id, now_seconds())));
      if (what == "bond") {
        json result = engine_.get_bond(id);
        result["holders"] = engine_.bond_holders(id);
        return reply(result);
      }
      if (what == "market") {
        auto m = engine_.market_for_project(id);
        if (!m)
          throw protocol::NotFoundError("No market for project " + id);
        return reply(market_view(*m));
      }
    }
    if (seg.size() == 5 && what == "milestones")
      return reply(json(engine_.milestone(id, parse_index(seg[4]))));
    if (seg.size() == 5 && what == "bonds") {
      const std::string &holder = seg[4];
      json result = {
          {"project_id", id},
          {"holder", holder},
          {"balance", engine_.bond_balance(id, holder)},
          {"total_supply", engine_.bond_supply(id)},
          {"claimable_yield", engine_.claimable_yield(id, holder)},
      };
      result.update(json(engine_.holder_yield(id, holder)));
      return reply(result);
    }
    not_found();
  }

  void post_projects(const Segments &seg) {
    json b = body();
    auto tx = make_tx();

    if (seg.size() == 2) {
      std::string id = engine_.register_project(tx, b.at("name").get<std::string>(),
                                                b.at("metadata_uri").get<std::string>(),
                                                b.at("funding_goal").get<Amount>(),
                                                b.at("bond_price").get<Amount>());
      return reply(json(engine_.get_project(id)), http::status::created);
    }

    const std::string &id = seg[2];
    if (seg.size() == 4) {
      const std::string &action = seg[3];
      if (action == "status") {
        engine_.update_status(tx, id, protocol::status_from_name(b.at("status").get<std::string>()));
        return reply(json(engine_.get_project(id)));
      }
      if (action == "bond") {
        engine_.create_bond(tx, id);
        return reply(json(engine_.get_bond(id)), http::status::created);
      }
      if (action == "purchase") {
        Amount minted = engine_.purchase_bonds(tx, id, b.at("amount").get<Amount>());
        return reply({{"bonds_minted", minted}, {"project", engine_.get_project(id)}});
      }
      if (action == "revenue") {
        engine_.deposit_revenue(tx, id, b.at("amount").get<Amount>());
        return reply(json(engine_.yield_info(id, tx.now)));
      }
      if (action == "claim") {
        Amount paid = engine_.claim_yield(tx, id);
        return reply({{"claimed", paid}});
      }
      if (action == "milestones") {
        engine_.setup_milestones(tx, id, b.at("descriptions").get<std::vector<std::string>>(),
                                 b.at("target_dates").get<std::vector<int64_t>>());
        return reply(json(engine_.milestones(id)), http::status::created);
      }
      if (action == "fail") {
        engine_.mark_project_failed(tx, id, b.at("reason").get<std::string>());
        return reply(json(engine_.get_project(id)));
      }
      if (action == "finalize") {
        engine_.finalize_project(tx, id);
        return reply(json(engine_.get_project(id)));
      }
    }
    if (seg.size() == 5 && seg[3] == "bonds" && seg[4] == "transfer") {
      engine_.transfer_bonds(tx, id, b.at("to").get<std::string>(), b.at("amount").get<Amount>());
      return reply({{"from", tx.caller}, {"balance", engine_.bond_balance(id, tx.caller)}});
    }
    if (seg.size() == 6 && seg[3] == "milestones" && seg[5] == "verify") {
      bool completed = engine_.verify_milestone(
          tx, id, parse_index(seg[4]), b.at("verified").get<bool>(),
          b.value("evidence_uri", std::string{}),
          b.value("data_sources", std::vector<std::string>{}), b.at("confidence").get<int>());
      return reply({{"project_completed", completed}, {"progress", engine_.project_progress(id)}});
    }
    not_found();
  }

  // GET /api/markets[/{id}[/trades | /quote | /positions/{holder}]]
  void get_markets(const Segments &seg) {
    if (seg.size() == 2) {
      json result = json::array();
      for (const auto &m : engine_.all_markets())
        result.push_back(market_view(m));
      return reply(result);
    }

    const std::string &id = seg[2];
    if (seg.size() == 3)
      return reply(market_view(engine_.get_market(id)));
    if (seg.size() == 4 && seg[3] == "trades")
      return reply(json(engine_.trades(id)));
    if (seg.size() == 4 && seg[3] == "quote") {
      bool is_yes = parse_side(get_param("side"));
      Amount shares = units::parse(get_param("shares"));
      std::string action = get_param("action");
      if (action.empty() || action == "buy")
        return reply({{"action", "buy"}, {"cost", engine_.cost_to_buy(id, is_yes, shares)}});
      if (action == "sell")
        return reply({{"action", "sell"}, {"payout", engine_.payout_for_sell(id, is_yes, shares)}});
      throw protocol::ValidationError("action must be buy or sell");
    }
    if (seg.size() == 5 && seg[3] == "positions") {
      json result = engine_.position(id, seg[4]);
      result["holder"] = seg[4];
      result["claimable_winnings"] = engine_.claimable_winnings(id, seg[4]);
      return reply(result);
    }
    not_found();
  }

  void post_markets(const Segments &seg) {
    json b = body();
    auto tx = make_tx();

    if (seg.size() == 2) {
      Amount liquidity = b.contains("liquidity") ? b.at("liquidity").get<Amount>() : Amount(0);
      std::string id = engine_.create_market(tx, b.at("project_id").get<std::string>(),
                                             b.at("question").get<std::string>(),
                                             b.at("resolution_time").get<int64_t>(), liquidity);
      return reply(market_view(engine_.get_market(id)), http::status::created);
    }

    const std::string &id = seg[2];
    if (seg.size() == 4) {
      const std::string &action = seg[3];
      if (action == "trade") {
        bool is_yes = parse_side(b.at("side").get<std::string>());
        Amount shares = b.at("shares").get<Amount>();
        std::string direction = b.value("action", std::string("buy"));
        if (direction == "buy")
          return reply({{"cost", engine_.buy(tx, id, is_yes, shares)},
                        {"market", market_view(engine_.get_market(id))}});
        if (direction == "sell")
          return reply({{"payout", engine_.sell(tx, id, is_yes, shares)},
                        {"market", market_view(engine_.get_market(id))}});
        throw protocol::ValidationError("action must be buy or sell");
      }
      if (action == "transfer") {
        engine_.transfer_outcome(tx, id, parse_side(b.at("side").get<std::string>()),
                                 b.at("to").get<std::string>(), b.at("shares").get<Amount>());
        return reply(json(engine_.position(id, tx.caller)));
      }
      if (action == "resolve") {
        engine_.resolve_market(tx, id, b.at("outcome").get<bool>());
        return reply(market_view(engine_.get_market(id)));
      }
      if (action == "claim") {
        Amount paid = engine_.claim_winnings(tx, id);
        return reply({{"payout", paid}});
      }
      if (action == "fund") {
        engine_.fund_market(tx, id, b.at("amount").get<Amount>());
        return reply(market_view(engine_.get_market(id)));
      }
    }
    not_found();
  }

  // GET /api/collateral/{account}, POST /api/collateral/credit
  void handle_collateral(const Segments &seg) {
    if (is_post() && seg.size() == 3 && seg[2] == "credit") {
      json b = body();
      std::string account = b.at("account").get<std::string>();
      engine_.credit_collateral(make_tx(), account, b.at("amount").get<Amount>());
      return reply({{"account", account}, {"balance", engine_.collateral_balance(account)}});
    }
    if (!is_post() && seg.size() == 3)
      return reply({{"account", seg[2]}, {"balance", engine_.collateral_balance(seg[2])}});
    not_found();
  }

  // POST /api/roles/grant|revoke, GET /api/roles/{account}
  void handle_roles(const Segments &seg) {
    if (is_post() && seg.size() == 3 && (seg[2] == "grant" || seg[2] == "revoke")) {
      json b = body();
      auto role = protocol::role_from_name(b.at("role").get<std::string>());
      std::string account = b.at("account").get<std::string>();
      if (seg[2] == "grant")
        engine_.grant_role(make_tx(), role, account);
      else
        engine_.revoke_role(make_tx(), role, account);
      return reply({{"account", account}, {"role", role}, {"granted", engine_.has_role(account, role)}});
    }
    if (!is_post() && seg.size() == 3) {
      return reply({{"account", seg[2]},
                    {"admin", engine_.has_role(seg[2], protocol::Role::Admin)},
                    {"oracle", engine_.has_role(seg[2], protocol::Role::Oracle)}});
    }
    not_found();
  }

  // GET /api/events?since=N&limit=M, indexer 按 seq 增量拉取
  void handle_events() {
    std::string since_str = get_param("since");
    std::string limit_str = get_param("limit");
    int64_t since = since_str.empty() ? 0 : std::stoll(since_str);
    size_t limit = limit_str.empty() ? 500 : std::min<size_t>(std::stoull(limit_str), 5000);

    json events = json::array();
    for (const auto &e : engine_.events_since(since, limit))
      events.push_back(ledger::to_json_row(e));
    reply({{"head_seq", engine_.head_seq()}, {"events", events}});
  }

  // ==========================================================================
  // 工具
  // ==========================================================================

  json market_view(const protocol::Market &m) {
    json view = m;
    view["yes_price"] = engine_.yes_price(m.id);
    view["no_price"] = engine_.no_price(m.id);
    view["escrow"] = engine_.market_escrow(m.id);
    return view;
  }

  bool is_post() const { return req_.method() == http::verb::post; }

  json body() const {
    if (req_.body().empty())
      return json::object();
    return json::parse(req_.body());
  }

  ledger::Tx make_tx() const {
    auto it = req_.find("X-Caller");
    if (it == req_.end() || it->value().empty())
      throw protocol::AuthorizationError("Missing X-Caller header");
    return {std::string(it->value()), now_seconds()};
  }

  static int64_t now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
  }

  static bool parse_side(const std::string &side) {
    if (side == "yes")
      return true;
    if (side == "no")
      return false;
    throw protocol::ValidationError("side must be yes or no");
  }

  static int parse_index(const std::string &s) {
    size_t used = 0;
    int index = std::stoi(s, &used);
    if (used != s.size())
      throw std::invalid_argument("invalid milestone index: " + s);
    return index;
  }

  static http::status status_for(protocol::ErrorKind kind) {
    switch (kind) {
    case protocol::ErrorKind::Validation: return http::status::bad_request;
    case protocol::ErrorKind::NotFound: return http::status::not_found;
    case protocol::ErrorKind::Authorization: return http::status::forbidden;
    case protocol::ErrorKind::StateConflict: return http::status::conflict;
    case protocol::ErrorKind::InsufficientFunds:
    case protocol::ErrorKind::InsufficientShares: return http::status::unprocessable_entity;
    }
    return http::status::internal_server_error;
  }

  void reply(const json &result, http::status status = http::status::ok) {
    res_.result(status);
    res_.set(http::field::content_type, "application/json");
    res_.body() = result.dump();
  }

  void reply_error(http::status status, const char *kind, const std::string &message) {
    reply({{"error", message}, {"kind", kind}}, status);
  }

  void not_found() { reply_error(http::status::not_found, "NotFoundError", "Not found"); }

  static Segments split_path(const std::string &path) {
    Segments out;
    size_t start = 1;
    while (start < path.size()) {
      size_t end = path.find('/', start);
      if (end == std::string::npos)
        end = path.size();
      if (end > start)
        out.push_back(url_decode(path.substr(start, end - start)));
      start = end + 1;
    }
    return out;
  }

  std::string get_param(const char *name) {
    std::string target(req_.target());
    auto q = target.find('?');
    if (q == std::string::npos)
      return "";
    std::string key = std::string(name) + "=";
    auto pos = target.find(key, q);
    while (pos != std::string::npos && target[pos - 1] != '?' && target[pos - 1] != '&')
      pos = target.find(key, pos + 1);
    if (pos == std::string::npos)
      return "";
    std::string value = target.substr(pos + key.size());
    auto amp = value.find('&');
    return url_decode(amp != std::string::npos ? value.substr(0, amp) : value);
  }

  static std::string url_decode(const std::string &str) {
    std::string result;
    for (size_t i = 0; i < str.size(); ++i) {
      if (str[i] == '%') {
        if (i + 2 >= str.size() || !std::isxdigit(static_cast<unsigned char>(str[i + 1])) ||
            !std::isxdigit(static_cast<unsigned char>(str[i + 2])))
          throw protocol::ValidationError("Malformed percent escape in " + str);
        result += static_cast<char>(std::stoi(str.substr(i + 1, 2), nullptr, 16));
        i += 2;
      } else if (str[i] == '+') {
        result += ' ';
      } else {
        result += str[i];
      }
    }
    return result;
  }

  void do_write() {
    http::async_write(socket_, res_,
                      [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (!ec && self->res_.keep_alive()) {
                          self->do_read();
                        } else {
                          beast::error_code shutdown_ec;
                          [[maybe_unused]] auto ret = self->socket_.shutdown(tcp::socket::shutdown_send, shutdown_ec);
                        }
                      });
  }

  tcp::socket socket_;
  protocol::Engine &engine_;
  MonitorStatusGetter monitor_getter_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  http::response<http::string_body> res_;
};
