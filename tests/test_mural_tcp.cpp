#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "core/api/node_api.hpp"
#include "core/model/message_codec.hpp"
#include "core/service/mural_node.hpp"
#include "core/storage/message_log.hpp"
#include "core/transport/tcp_client.hpp"
#include "core/transport/tcp_server.hpp"
#include "core/transport/tcp_transport.hpp"
#include "core/transport/wire.hpp"

namespace {

constexpr auto kTimeout = std::chrono::milliseconds(2000);

// A node served over a real socket on 127.0.0.1. The listener starts first
// so peers can be configured with the ephemeral port.
struct ServedNode {
  std::unique_ptr<mural::NodeApi> api;
  std::unique_ptr<mural::TcpServer> server;
  std::unique_ptr<mural::MuralNode> node;

  ServedNode() {
    server = std::make_unique<mural::TcpServer>(
        "127.0.0.1", 0,
        [this](std::string_view request) {
          if (api == nullptr) {
            return mural::wire::make_response(mural::Result::failure(mural::ErrorKind::Unavailable, "starting"));
          }
          return api->handle(request);
        },
        2, nullptr);
    const mural::Result started = server->start();
    assert(started.ok);
    assert(server->bound_port() != 0);
  }

  ~ServedNode() {
    server->stop();
    if (node != nullptr) {
      node->shutdown();
    }
  }

  [[nodiscard]] std::string address() const { return "127.0.0.1:" + std::to_string(server->bound_port()); }

  void boot(const std::string& node_id, const std::vector<std::pair<std::string, std::string>>& peers) {
    mural::NodeConfig config;
    config.node_id = node_id;
    config.data_dir.clear();
    config.users = {{.username = "alice", .password = "password1"}, {.username = "bob", .password = "password2"}};
    config.admin_users = {"alice"};
    config.retry = {.base_delay_ms = 5, .max_delay_ms = 20, .max_attempts = 2, .push_timeout_ms = 1000};
    for (const auto& [peer_id, address] : peers) {
      config.peers.push_back({.peer_id = peer_id, .address = address});
    }
    node = std::make_unique<mural::MuralNode>(config, std::make_shared<mural::TcpPeerTransport>(),
                                              std::make_unique<mural::MemoryMessageLog>());
    assert(node->init().ok);
    node->set_listen_address(address());
    api = std::make_unique<mural::NodeApi>(*node);
  }
};

mural::Result call(const std::string& address, const std::string& op,
                   std::vector<std::pair<std::string, std::string>> fields, mural::wire::Fields& reply) {
  std::string response;
  const mural::Result sent = mural::tcp_exchange(address, mural::wire::make_request(op, std::move(fields)), kTimeout,
                                                 response);
  if (!sent.ok) {
    return sent;
  }
  return mural::wire::parse_response(response, reply);
}

void test_client_and_peer_ops_over_tcp() {
  ServedNode a;
  ServedNode b;
  a.boot("a", {{"b", b.address()}});
  b.boot("b", {{"a", a.address()}});

  mural::wire::Fields reply;
  const mural::Result login = call(a.address(), "login", {{"username", "alice"}, {"password", "password1"}}, reply);
  assert(login.ok);
  const std::string token = login.data;
  assert(call(a.address(), "login", {{"username", "alice"}, {"password", "bad"}}, reply).kind ==
         mural::ErrorKind::Authorization);

  const mural::Result posted =
      call(a.address(), "post", {{"token", token}, {"content", "over\nthe wire"}}, reply);
  assert(posted.ok);
  assert(reply.at("id") == "a-1");
  assert(reply.at("author") == "alice");

  assert(call(a.address(), "post", {{"token", "nope"}, {"content", "x"}}, reply).kind ==
         mural::ErrorKind::Authorization);

  a.node->wait_for_replication();
  assert(b.node->store().contains("a-1"));

  assert(call(b.address(), "list", {}, reply).ok);
  assert(reply.at("count") == "1");
  assert(reply.at("more") == "0");
  assert(reply.at("next") == "a-1");
  std::vector<mural::Message> listed;
  std::size_t invalid = 0;
  mural::decode_message_block(reply.at("messages"), listed, invalid);
  assert(invalid == 0);
  assert(listed.size() == 1);
  assert(listed.front().content == "over\nthe wire");

  assert(call(a.address(), "status", {}, reply).ok);
  assert(reply.at("node_id") == "a");
  assert(reply.at("mode") == "online");
  assert(reply.at("message_count") == "1");
  assert(reply.at("pushes_delivered") == "1");
  assert(reply.at("digest") == b.node->store().digest());

  assert(call(a.address(), "peers", {}, reply).ok);
  assert(reply.at("peers").starts_with("b\t" + b.address() + "\t1\t0"));

  assert(call(a.address(), "bogus", {}, reply).kind == mural::ErrorKind::Protocol);

  std::string raw;
  assert(mural::tcp_exchange(a.address(), "op=list\nprotocol=other\n", kTimeout, raw).ok);
  assert(mural::wire::parse_response(raw, reply).kind == mural::ErrorKind::Protocol);
}

void test_offline_and_reconcile_over_tcp() {
  ServedNode a;
  ServedNode b;
  a.boot("a", {{"b", b.address()}});
  b.boot("b", {{"a", a.address()}});

  mural::wire::Fields reply;
  assert(call(b.address(), "offline", {}, reply).kind == mural::ErrorKind::Authorization);
  const std::string bob = b.node->login("bob", "password2").data;
  assert(call(b.address(), "offline", {{"token", bob}}, reply).kind == mural::ErrorKind::Authorization);
  assert(!b.node->offline());

  const std::string admin = b.node->login("alice", "password1").data;
  assert(call(b.address(), "offline", {{"token", admin}}, reply).ok);
  assert(b.node->offline());
  assert(call(b.address(), "online", {{"token", bob}}, reply).kind == mural::ErrorKind::Authorization);
  assert(b.node->offline());

  const std::string token = a.node->login("alice", "password1").data;
  assert(a.node->post_message(token, "", "missed by b").ok);
  a.node->wait_for_replication();
  assert(!b.node->store().contains("a-1"));
  assert(a.node->status().replication.pushes_abandoned == 1);

  // Pull requests are refused while down.
  mural::TcpPeerTransport transport;
  std::vector<mural::Message> snapshot;
  const mural::PeerEntry b_entry{.peer_id = "b", .address = b.address()};
  assert(transport.pull_snapshot(b_entry, kTimeout, snapshot).kind == mural::ErrorKind::Unavailable);

  assert(call(b.address(), "online", {{"token", admin}}, reply).ok);
  assert(reply.at("added") == "1");
  assert(b.node->store().contains("a-1"));

  assert(call(b.address(), "reconcile", {}, reply).ok);
  assert(reply.at("added") == "0");
  assert(reply.at("unreachable").empty());

  assert(transport.pull_snapshot(b_entry, kTimeout, snapshot).ok);
  assert(snapshot.size() == 1);
}

void test_unreachable_and_slow_peers() {
  std::string closed_address;
  {
    mural::TcpServer closed("127.0.0.1", 0, [](std::string_view) { return std::string{}; }, 1, nullptr);
    assert(closed.start().ok);
    closed_address = "127.0.0.1:" + std::to_string(closed.bound_port());
    closed.stop();
  }

  mural::TcpPeerTransport transport;
  const mural::Message message{
      .id = "x-1",
      .author = "alice",
      .content = "hi",
      .logical_ts = {.counter = 1, .node_id = "x"},
      .origin_node = "x",
  };
  const mural::Result refused =
      transport.push_message({.peer_id = "gone", .address = closed_address}, "x", message, kTimeout);
  assert(!refused.ok);
  assert(refused.kind == mural::ErrorKind::PeerUnreachable);

  mural::TcpServer slow(
      "127.0.0.1", 0,
      [](std::string_view) {
        std::this_thread::sleep_for(std::chrono::milliseconds(600));
        return mural::wire::make_response(mural::Result::success());
      },
      1, nullptr);
  assert(slow.start().ok);
  const auto started = std::chrono::steady_clock::now();
  const mural::Result timed_out = transport.push_message(
      {.peer_id = "slow", .address = "127.0.0.1:" + std::to_string(slow.bound_port())}, "x", message,
      std::chrono::milliseconds(100));
  assert(!timed_out.ok);
  assert(timed_out.kind == mural::ErrorKind::PeerUnreachable);
  assert(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(550));
  slow.stop();
}

// 1100 posts of 4 KiB hex-encode to more than one 8 MiB frame.
void test_snapshot_larger_than_a_frame() {
  ServedNode a;
  ServedNode b;
  a.boot("a", {});

  const std::string token = a.node->login("alice", "password1").data;
  const std::string content(4096, 'x');
  constexpr std::size_t kPosts = 1100;
  for (std::size_t i = 0; i < kPosts; ++i) {
    assert(a.node->post_message(token, "", content).ok);
  }

  // One oversized page request is cut to fit a frame and says more follow.
  mural::wire::Fields reply;
  assert(call(a.address(), "pull", {{"limit", "1024"}}, reply).ok);
  mural::SnapshotPage page;
  assert(mural::wire::read_page(reply, page).ok);
  assert(page.more);
  assert(!page.messages.empty());
  assert(page.messages.size() < 1024);
  assert(reply.at("next") == page.messages.back().id);

  assert(call(a.address(), "pull", {{"limit", "0"}}, reply).kind == mural::ErrorKind::InvalidInput);

  b.boot("b", {{"a", a.address()}});
  mural::ReconcileReport report;
  const mural::Result reconciled = b.node->reconcile_now(report);
  assert(reconciled.ok);
  assert(report.messages_added == kPosts);
  assert(b.node->store().size() == kPosts);
  assert(b.node->store().digest() == a.node->store().digest());

  // Listing pages the same way.
  std::vector<mural::Message> listed;
  std::string after;
  std::size_t pages = 0;
  for (;;) {
    assert(call(b.address(), "list", {{"after", after}, {"limit", "1000"}}, reply).ok);
    assert(mural::wire::read_page(reply, page).ok);
    assert(reply.at("count") == std::to_string(kPosts));
    listed.insert(listed.end(), page.messages.begin(), page.messages.end());
    ++pages;
    if (!page.more) {
      break;
    }
    after = reply.at("next");
  }
  assert(pages > 1);
  assert(listed.size() == kPosts);
}

}  // namespace

int main() {
  test_client_and_peer_ops_over_tcp();
  test_offline_and_reconcile_over_tcp();
  test_unreachable_and_slow_peers();
  test_snapshot_larger_than_a_frame();

  std::cout << "mural_tcp_tests passed\n";
  return 0;
}
