#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "core/api/node_api.hpp"
#include "core/config/node_config.hpp"
#include "core/log/logging.hpp"
#include "core/model/app_meta.hpp"
#include "core/service/mural_node.hpp"
#include "core/transport/tcp_server.hpp"
#include "core/transport/tcp_transport.hpp"

namespace {

void print_usage() {
  std::cout << mural::kAppDisplayName << " " << mural::kAppVersion << " (" << mural::kBuildRelease << ")\n"
            << "usage: muralnode [--config file] [--node-id id] [--listen host:port]\n"
            << "                 [--peers id@host:port,...] [--data-dir dir] [--log-level level]\n";
}

}  // namespace

int main(int argc, char** argv) {
  if (argc > 1 && (std::string{argv[1]} == "--help" || std::string{argv[1]} == "-h")) {
    print_usage();
    return 0;
  }

  mural::NodeConfig config;
  const mural::Result parsed = mural::parse_node_arguments(argc, argv, config);
  if (!parsed.ok) {
    std::cerr << "muralnode: " << parsed.message << '\n';
    print_usage();
    return 2;
  }
  const mural::Result valid = mural::validate_node_config(config);
  if (!valid.ok) {
    std::cerr << "muralnode: " << valid.message << '\n';
    return 2;
  }
  auto logger = mural::log::node_logger(config.node_id);
  if (!mural::log::set_level(config.log_level)) {
    logger->warn("unknown log level {}, keeping default", config.log_level);
  }
  mural::MuralNode node(config, std::make_shared<mural::TcpPeerTransport>());
  const mural::Result init = node.init();
  if (!init.ok) {
    logger->critical("init failed: {}", init.message);
    return 1;
  }

  mural::NodeApi api(node);
  mural::TcpServer server(
      config.listen_host, config.listen_port, [&api](std::string_view request) { return api.handle(request); },
      config.server_threads, logger);
  const mural::Result started = server.start();
  if (!started.ok) {
    logger->critical("{}", started.message);
    node.shutdown();
    return 1;
  }
  node.set_listen_address(config.listen_host + ":" + std::to_string(server.bound_port()));
  logger->info("listening on {}:{} with {} peer(s)", config.listen_host, server.bound_port(), node.peers().size());

  boost::asio::io_context signals_io;
  boost::asio::signal_set signals(signals_io, SIGINT, SIGTERM);
  signals.async_wait([&logger](const boost::system::error_code& ec, int signal_number) {
    if (!ec) {
      logger->info("signal {} received, shutting down", signal_number);
    }
  });
  signals_io.run();

  server.stop();
  node.shutdown();
  return 0;
}
