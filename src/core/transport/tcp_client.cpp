#include "core/transport/tcp_client.hpp"

#include <array>
#include <cstdint>
#include <string>

#include <boost/asio.hpp>

#include "core/transport/wire.hpp"

namespace mural {
namespace {

using boost::asio::ip::tcp;

}  // namespace

Result tcp_exchange(std::string_view address, std::string_view request,
                    std::chrono::milliseconds timeout, std::string& out_response) {
  out_response.clear();

  std::string host;
  std::uint16_t port = 0;
  if (!wire::split_host_port(address, host, port)) {
    return Result::failure(ErrorKind::InvalidInput, "Invalid peer address: " + std::string{address});
  }

  const auto frame = wire::encode_frame(request);
  if (!frame) {
    return Result::failure(ErrorKind::Protocol, "Request exceeds maximum frame size.");
  }

  boost::asio::io_context io;
  tcp::resolver resolver(io);
  tcp::socket socket(io);
  std::array<unsigned char, wire::kHeaderBytes> header{};
  std::string body;
  boost::system::error_code failure;
  std::string stage = "resolve";
  bool completed = false;

  resolver.async_resolve(
      host, std::to_string(port),
      [&](const boost::system::error_code& resolve_ec, tcp::resolver::results_type endpoints) {
        if (resolve_ec) {
          failure = resolve_ec;
          return;
        }
        stage = "connect";
        boost::asio::async_connect(
            socket, endpoints, [&](const boost::system::error_code& connect_ec, const tcp::endpoint&) {
              if (connect_ec) {
                failure = connect_ec;
                return;
              }
              stage = "write";
              boost::asio::async_write(
                  socket, boost::asio::buffer(*frame),
                  [&](const boost::system::error_code& write_ec, std::size_t) {
                    if (write_ec) {
                      failure = write_ec;
                      return;
                    }
                    stage = "read";
                    boost::asio::async_read(
                        socket, boost::asio::buffer(header),
                        [&](const boost::system::error_code& header_ec, std::size_t) {
                          if (header_ec) {
                            failure = header_ec;
                            return;
                          }
                          const std::uint32_t length = wire::decode_header(header);
                          if (length > wire::kMaxFrameBytes) {
                            failure = boost::asio::error::message_size;
                            return;
                          }
                          body.resize(length);
                          boost::asio::async_read(
                              socket, boost::asio::buffer(body),
                              [&](const boost::system::error_code& body_ec, std::size_t) {
                                if (body_ec) {
                                  failure = body_ec;
                                  return;
                                }
                                completed = true;
                              });
                        });
                  });
            });
      });

  io.run_for(timeout);
  if (!io.stopped()) {
    boost::system::error_code ignored;
    resolver.cancel();
    socket.close(ignored);
    io.restart();
    io.run();
    return Result::failure(ErrorKind::PeerUnreachable,
                           "Timed out during " + stage + " with " + std::string{address});
  }

  if (!completed) {
    return Result::failure(ErrorKind::PeerUnreachable, stage + " failed for " + std::string{address} +
                                                           ": " + failure.message());
  }

  out_response = std::move(body);
  return Result::success();
}

}  // namespace mural
