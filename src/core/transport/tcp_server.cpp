#include "core/transport/tcp_server.hpp"

#include <array>

#include "core/transport/wire.hpp"

namespace mural {
namespace {

using boost::asio::ip::tcp;

class Session : public std::enable_shared_from_this<Session> {
public:
  Session(tcp::socket socket, const TcpServer::Handler& handler,
          std::shared_ptr<spdlog::logger> logger)
      : socket_(std::move(socket)), handler_(handler), logger_(std::move(logger)) {}

  void start() { read_header(); }

private:
  void read_header() {
    auto self = shared_from_this();
    boost::asio::async_read(socket_, boost::asio::buffer(header_),
                            [this, self](const boost::system::error_code& ec, std::size_t) {
                              if (ec) {
                                return;
                              }
                              const std::uint32_t length = wire::decode_header(header_);
                              if (length > wire::kMaxFrameBytes) {
                                if (logger_) {
                                  logger_->warn("rejecting oversized frame of {} bytes", length);
                                }
                                boost::system::error_code ignored;
                                socket_.close(ignored);
                                return;
                              }
                              body_.resize(length);
                              read_body();
                            });
  }

  void read_body() {
    auto self = shared_from_this();
    boost::asio::async_read(socket_, boost::asio::buffer(body_),
                            [this, self](const boost::system::error_code& ec, std::size_t) {
                              if (ec) {
                                return;
                              }
                              respond(handler_(body_));
                            });
  }

  void respond(const std::string& payload) {
    auto frame = wire::encode_frame(payload);
    if (!frame) {
      frame = wire::encode_frame(wire::make_response(
          Result::failure(ErrorKind::Protocol, "Response exceeds maximum frame size.")));
    }
    outgoing_ = std::move(*frame);

    auto self = shared_from_this();
    boost::asio::async_write(socket_, boost::asio::buffer(outgoing_),
                             [this, self](const boost::system::error_code& ec, std::size_t) {
                               if (ec) {
                                 return;
                               }
                               read_header();
                             });
  }

  tcp::socket socket_;
  const TcpServer::Handler& handler_;
  std::shared_ptr<spdlog::logger> logger_;
  std::array<unsigned char, wire::kHeaderBytes> header_{};
  std::string body_;
  std::string outgoing_;
};

}  // namespace

TcpServer::TcpServer(std::string host, std::uint16_t port, Handler handler, std::size_t threads,
                     std::shared_ptr<spdlog::logger> logger)
    : host_(std::move(host)),
      port_(port),
      handler_(std::move(handler)),
      thread_count_(threads == 0 ? 1 : threads),
      logger_(std::move(logger)),
      acceptor_(io_) {}

TcpServer::~TcpServer() {
  stop();
}

Result TcpServer::start() {
  if (running_) {
    return Result::success("Server already running.");
  }

  boost::system::error_code ec;
  const auto address = boost::asio::ip::make_address(host_, ec);
  if (ec) {
    return Result::failure(ErrorKind::InvalidInput, "Invalid listen host " + host_ + ": " + ec.message());
  }

  const tcp::endpoint endpoint{address, port_};
  acceptor_.open(endpoint.protocol(), ec);
  if (ec) {
    return Result::failure(ErrorKind::Unavailable, "Unable to open listener: " + ec.message());
  }
  acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
  acceptor_.bind(endpoint, ec);
  if (ec) {
    acceptor_.close();
    return Result::failure(ErrorKind::Unavailable, "Unable to bind " + host_ + ":" +
                                                       std::to_string(port_) + ": " + ec.message());
  }
  acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
  if (ec) {
    acceptor_.close();
    return Result::failure(ErrorKind::Unavailable, "Unable to listen: " + ec.message());
  }

  bound_port_ = acceptor_.local_endpoint().port();
  running_ = true;
  do_accept();

  threads_.reserve(thread_count_);
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back([this] { io_.run(); });
  }

  if (logger_) {
    logger_->info("listening on {}:{}", host_, bound_port_);
  }
  return Result::success("Listening.", std::to_string(bound_port_));
}

void TcpServer::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  io_.stop();
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();

  boost::system::error_code ignored;
  acceptor_.close(ignored);

  if (logger_) {
    logger_->info("listener on port {} stopped", bound_port_);
  }
}

void TcpServer::do_accept() {
  acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
    if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) {
      return;
    }
    if (!ec) {
      std::make_shared<Session>(std::move(socket), handler_, logger_)->start();
    } else if (logger_) {
      logger_->warn("accept failed: {}", ec.message());
    }
    do_accept();
  });
}

}  // namespace mural
