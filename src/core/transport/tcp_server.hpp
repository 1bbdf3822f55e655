#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <spdlog/logger.h>

#include "core/model/types.hpp"

namespace mural {

// Accepts framed requests and answers each with the handler's payload.
// Handlers run on the server's own thread pool and may block.
class TcpServer {
public:
  using Handler = std::function<std::string(std::string_view request)>;

  TcpServer(std::string host, std::uint16_t port, Handler handler, std::size_t threads,
            std::shared_ptr<spdlog::logger> logger);
  ~TcpServer();

  TcpServer(const TcpServer&) = delete;
  TcpServer& operator=(const TcpServer&) = delete;

  Result start();
  void stop();

  [[nodiscard]] bool running() const { return running_; }
  [[nodiscard]] std::uint16_t bound_port() const { return bound_port_; }

private:
  void do_accept();

  std::string host_;
  std::uint16_t port_ = 0;
  Handler handler_;
  std::size_t thread_count_ = 2;
  std::shared_ptr<spdlog::logger> logger_;

  boost::asio::io_context io_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::vector<std::thread> threads_;
  std::atomic<bool> running_ = false;
  std::uint16_t bound_port_ = 0;
};

}  // namespace mural
