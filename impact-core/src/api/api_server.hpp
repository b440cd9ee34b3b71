#pragma once

// ============================================================================
// API Server - HTTP 服务器
// ============================================================================

#include <iostream>
#include <memory>

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include "../protocol/engine.hpp"
#include "api_session.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

class ApiServer {
public:
  ApiServer(asio::io_context &ioc, protocol::Engine &engine, unsigned short port,
            ApiSession::MonitorStatusGetter monitor_getter = nullptr)
      : acceptor_(ioc, tcp::endpoint(tcp::v4(), port)), engine_(engine),
        monitor_getter_(std::move(monitor_getter)) {
    std::cout << "[HTTP] 监听端口 " << port << std::endl;
    do_accept();
  }

  // 以端口 0 启动时为系统分配的端口
  unsigned short port() const { return acceptor_.local_endpoint().port(); }

private:
  void do_accept() {
    acceptor_.async_accept(
        [this](beast::error_code ec, tcp::socket socket) {
          if (ec == asio::error::operation_aborted)
            return;
          if (!ec) {
            std::make_shared<ApiSession>(std::move(socket), engine_, monitor_getter_)->run();
          } else {
            std::cerr << "[HTTP] accept 失败: " << ec.message() << std::endl;
          }
          do_accept();
        });
  }

  tcp::acceptor acceptor_;
  protocol::Engine &engine_;
  ApiSession::MonitorStatusGetter monitor_getter_;
};
