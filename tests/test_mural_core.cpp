#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "core/auth/auth_gate.hpp"
#include "core/clock/lamport_clock.hpp"
#include "core/config/node_config.hpp"
#include "core/model/message_codec.hpp"
#include "core/p2p/peer_registry.hpp"
#include "core/replication/replication_manager.hpp"
#include "core/storage/message_log.hpp"
#include "core/storage/message_store.hpp"
#include "core/transport/peer_transport.hpp"
#include "core/transport/wire.hpp"
#include "core/util/canonical.hpp"

namespace {

std::filesystem::path temp_dir(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "muralnet-tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

mural::Message make_message(const std::string& origin, std::uint64_t sequence, std::uint64_t counter,
                            const std::string& text = "hello") {
  return {
      .id = origin + "-" + std::to_string(sequence),
      .author = "alice",
      .content = text,
      .logical_ts = {.counter = counter, .node_id = origin},
      .origin_node = origin,
  };
}

void test_lamport_clock() {
  mural::LamportClock clock("n1");
  const auto first = clock.next();
  const auto second = clock.next();
  assert(first.counter == 1);
  assert(second.counter == 2);
  assert(first < second);
  assert(second.node_id == "n1");

  clock.observe(10);
  assert(clock.current() == 10);
  assert(clock.next().counter == 11);

  clock.observe(3);
  assert(clock.current() == 11);

  // Equal counters fall back to node id.
  const mural::LogicalTimestamp a{.counter = 5, .node_id = "a"};
  const mural::LogicalTimestamp b{.counter = 5, .node_id = "b"};
  assert(a < b);

  mural::LamportClock shared("n2");
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&shared] {
      for (int j = 0; j < 250; ++j) {
        (void)shared.next();
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  assert(shared.current() == 1000);
}

void test_store_insert_and_duplicates() {
  mural::MessageStore store(std::make_unique<mural::MemoryMessageLog>());
  assert(store.open().ok);

  const auto message = make_message("n1", 1, 1);
  assert(store.insert(message).ok);
  assert(store.contains("n1-1"));
  assert(store.size() == 1);

  const mural::Result duplicate = store.insert(message);
  assert(!duplicate.ok);
  assert(duplicate.kind == mural::ErrorKind::DuplicateId);
  assert(store.size() == 1);

  mural::Message malformed = make_message("n1", 2, 0);
  const mural::Result rejected = store.insert(malformed);
  assert(!rejected.ok);
  assert(rejected.kind == mural::ErrorKind::InvalidInput);
}

void test_store_merge_idempotent_and_commutative() {
  const std::vector<mural::Message> batch_a = {make_message("n1", 1, 1), make_message("n1", 2, 2)};
  const std::vector<mural::Message> batch_b = {make_message("n2", 1, 1), make_message("n1", 2, 2)};

  mural::MessageStore left(std::make_unique<mural::MemoryMessageLog>());
  mural::MessageStore right(std::make_unique<mural::MemoryMessageLog>());
  assert(left.open().ok);
  assert(right.open().ok);

  std::size_t added = 0;
  assert(left.merge(batch_a, added).ok);
  assert(added == 2);
  assert(left.merge(batch_b, added).ok);
  assert(added == 1);
  assert(left.merge(batch_b, added).ok);
  assert(added == 0);

  assert(right.merge(batch_b, added).ok);
  assert(right.merge(batch_a, added).ok);

  assert(left.size() == 3);
  assert(left.snapshot() == right.snapshot());
  assert(left.digest() == right.digest());

  // First copy wins on an id collision.
  mural::Message imposter = make_message("n1", 1, 1, "different text");
  assert(left.merge({imposter}, added).ok);
  assert(added == 0);
  for (const auto& message : left.snapshot()) {
    if (message.id == "n1-1") {
      assert(message.content == "hello");
    }
  }

  // Malformed input is skipped, the rest still merges.
  mural::Message broken = make_message("n3", 1, 1);
  broken.id.clear();
  assert(left.merge({broken, make_message("n3", 2, 4)}, added).ok);
  assert(added == 1);
  assert(left.max_counter() == 4);
}

void test_store_ordered_view() {
  mural::MessageStore store(std::make_unique<mural::MemoryMessageLog>());
  assert(store.open().ok);

  std::size_t added = 0;
  assert(store.merge({make_message("n2", 1, 3), make_message("n1", 2, 3), make_message("n3", 1, 1),
                      make_message("n1", 1, 2)},
                     added)
             .ok);

  const auto view = store.ordered_view();
  assert(view.size() == 4);
  assert(view[0].id == "n3-1");
  assert(view[1].id == "n1-1");
  // Counter 3 tie: n1 < n2 by node id.
  assert(view[2].id == "n1-2");
  assert(view[3].id == "n2-1");

  for (std::size_t i = 1; i < view.size(); ++i) {
    assert(mural::display_before(view[i - 1], view[i]));
  }
}

void test_store_pages_in_id_order() {
  mural::MessageStore store(std::make_unique<mural::MemoryMessageLog>());
  assert(store.open().ok);
  std::size_t added = 0;
  assert(store.merge({make_message("n2", 1, 1), make_message("n1", 1, 1), make_message("n1", 2, 2),
                      make_message("n3", 1, 4), make_message("n2", 2, 3)},
                     added)
             .ok);

  auto page = store.page_after("", 2);
  assert(page.messages.size() == 2);
  assert(page.messages[0].id == "n1-1");
  assert(page.messages[1].id == "n1-2");
  assert(page.more);

  page = store.page_after("n1-2", 2);
  assert(page.messages.size() == 2);
  assert(page.messages[0].id == "n2-1");
  assert(page.more);

  // The cursor need not be a stored id.
  page = store.page_after("n2-15", 10);
  assert(page.messages.size() == 2);
  assert(page.messages[0].id == "n2-2");
  assert(!page.more);

  page = store.page_after("n3-1", 10);
  assert(page.messages.empty());
  assert(!page.more);
}

void test_store_file_persistence() {
  const auto dir = temp_dir("store-file");
  const std::string path = mural::message_log_path(dir.string(), "n1");

  {
    mural::MessageStore store(std::make_unique<mural::FileMessageLog>(path));
    assert(store.open().ok);
    assert(store.insert(make_message("n1", 1, 1, "first line\twith tab")).ok);
    assert(store.insert(make_message("n1", 2, 5, "second\nmultiline")).ok);
  }
  assert(std::filesystem::exists(path));

  {
    std::ofstream corrupt(path, std::ios::app);
    corrupt << "not-a-record\n";
  }

  mural::MessageStore reloaded(std::make_unique<mural::FileMessageLog>(path));
  assert(reloaded.open().ok);
  assert(reloaded.size() == 2);
  assert(reloaded.max_counter() == 5);
  assert(reloaded.max_sequence_for("n1") == 2);
  assert(reloaded.max_sequence_for("n2") == 0);

  const auto view = reloaded.ordered_view();
  assert(view[0].content == "first line\twith tab");
  assert(view[1].content == "second\nmultiline");

  const auto health = reloaded.health_report();
  assert(health.healthy);
  assert(health.invalid_record_count == 1);
  assert(health.message_count == 2);
  assert(!health.digest.empty());
}

void test_store_persistence_failure() {
  auto log = std::make_unique<mural::MemoryMessageLog>();
  mural::MemoryMessageLog* raw_log = log.get();
  mural::MessageStore store(std::move(log));
  assert(store.open().ok);

  raw_log->set_fail_appends(true);
  const mural::Result failed = store.insert(make_message("n1", 1, 1));
  assert(!failed.ok);
  assert(failed.kind == mural::ErrorKind::Persistence);
  assert(store.size() == 0);

  std::size_t added = 0;
  assert(!store.merge({make_message("n2", 1, 1)}, added).ok);
  assert(added == 0);
  assert(!store.contains("n2-1"));

  raw_log->set_fail_appends(false);
  assert(store.insert(make_message("n1", 1, 1)).ok);
  assert(raw_log->records().size() == 1);
}

void test_peer_registry() {
  mural::PeerRegistry registry("self", 3, nullptr);
  assert(registry.add_peer("n2", "127.0.0.1:5002").ok);
  assert(registry.add_peer("n3", "127.0.0.1:5003").ok);
  assert(registry.add_peer("n2", "127.0.0.1:5002").ok);
  assert(!registry.add_peer("n2", "127.0.0.1:6000").ok);
  assert(!registry.add_peer("self", "127.0.0.1:5001").ok);
  assert(registry.size() == 2);
  assert(registry.list_peers().front().peer_id == "n2");

  registry.mark_result("n2", false);
  registry.mark_result("n2", false);
  assert(registry.find("n2")->reachable);
  registry.mark_result("n2", false);
  assert(!registry.find("n2")->reachable);
  assert(registry.find("n2")->consecutive_failures == 3);

  registry.mark_result("n2", true);
  assert(registry.find("n2")->reachable);
  assert(registry.find("n2")->consecutive_failures == 0);

  // Unknown peers are ignored.
  registry.mark_result("ghost", false);
  assert(!registry.find("ghost").has_value());

  const auto dir = temp_dir("peers-dat");
  const std::string dat = (dir / "peers-self.dat").string();
  assert(registry.save_peers_dat(dat).ok);

  mural::PeerRegistry restored("self", 3, nullptr);
  assert(restored.load_peers_dat(dat).ok);
  assert(restored.size() == 2);
  assert(restored.find("n3")->address == "127.0.0.1:5003");

  const auto spec = mural::parse_peer_spec(" n9@host.example:7000 ");
  assert(spec.has_value());
  assert(spec->peer_id == "n9");
  assert(spec->address == "host.example:7000");
  assert(!mural::parse_peer_spec("missing-at").has_value());
  assert(!mural::parse_peer_spec("@host:1").has_value());
}

void test_node_config() {
  const auto dir = temp_dir("config");
  const auto path = dir / "node.conf";
  {
    std::ofstream out(path);
    out << "# board node\n"
        << "node_id = n1\n"
        << "listen_port=5101\n"
        << "peers=n2@127.0.0.1:5102, n3@127.0.0.1:5103\n"
        << "users=alice:pw1,bob:pw2\n"
        << "admin_users=alice\n"
        << "push_base_delay_ms=50\n"
        << "reconcile_interval_seconds=30\n";
  }

  mural::NodeConfig config;
  assert(mural::load_node_config(path.string(), config).ok);
  assert(config.node_id == "n1");
  assert(config.listen_port == 5101);
  assert(config.peers.size() == 2);
  assert(config.peers[1].address == "127.0.0.1:5103");
  assert(config.users.size() == 2);
  assert(config.admin_users == std::vector<std::string>{"alice"});
  assert(config.retry.base_delay_ms == 50);
  assert(config.retry.max_delay_ms == 5000);
  assert(config.retry.max_attempts == 5);
  assert(config.reconcile_interval_seconds == 30);
  assert(mural::validate_node_config(config).ok);

  const std::string path_text = path.string();
  std::vector<std::string> args = {"muralnode", "--config", path_text, "--node-id", "n7", "--listen", "0.0.0.0:6000"};
  std::vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  mural::NodeConfig overridden;
  assert(mural::parse_node_arguments(static_cast<int>(argv.size()), argv.data(), overridden).ok);
  assert(overridden.node_id == "n7");
  assert(overridden.listen_host == "0.0.0.0");
  assert(overridden.listen_port == 6000);
  assert(overridden.peers.size() == 2);

  mural::NodeConfig bad = config;
  bad.peers.push_back({.peer_id = "n1", .address = "127.0.0.1:1"});
  assert(!mural::validate_node_config(bad).ok);

  bad = config;
  bad.peers.push_back({.peer_id = "n2", .address = "127.0.0.1:9"});
  assert(!mural::validate_node_config(bad).ok);

  bad = config;
  bad.users.clear();
  assert(!mural::validate_node_config(bad).ok);

  bad = config;
  bad.admin_users.push_back("mallory");
  assert(!mural::validate_node_config(bad).ok);

  bad = config;
  bad.node_id = "bad id";
  assert(!mural::validate_node_config(bad).ok);

  mural::NodeConfig unknown;
  assert(!mural::apply_config_fields({{"push_attempts", "3"}}, unknown).ok);
  assert(!mural::apply_config_fields({{"listen_port", "70000"}}, unknown).ok);
  assert(!mural::apply_config_fields({{"peers", "n2-no-address"}}, unknown).ok);
  assert(!mural::apply_config_fields({{"max_content_bytes", std::to_string(mural::kMaxContentBytesLimit + 1)}},
                                     unknown)
              .ok);
}

void test_backoff_schedule() {
  const mural::RetryPolicy policy;
  using mural::ReplicationManager;
  assert(ReplicationManager::backoff_delay(policy, 1).count() == 200);
  assert(ReplicationManager::backoff_delay(policy, 2).count() == 400);
  assert(ReplicationManager::backoff_delay(policy, 3).count() == 800);
  assert(ReplicationManager::backoff_delay(policy, 4).count() == 1600);
  assert(ReplicationManager::backoff_delay(policy, 5).count() == 3200);
  assert(ReplicationManager::backoff_delay(policy, 6).count() == 5000);
  assert(ReplicationManager::backoff_delay(policy, 40).count() == 5000);
}

void test_message_codec_and_wire() {
  const auto message = make_message("n1", 4, 9, "tabs\tand\nnewlines\\");
  const auto decoded = mural::decode_message_line(mural::encode_message_line(message));
  assert(decoded.has_value());
  assert(*decoded == message);

  assert(!mural::decode_message_line("n1-1\tn1\tzero\tn1\t61\t62").has_value());
  assert(!mural::decode_message_line("").has_value());

  std::vector<mural::Message> out;
  std::size_t invalid = 0;
  const std::string block = "# header\n" + mural::encode_message_line(message) + "\ngarbage\n\n";
  mural::decode_message_block(block, out, invalid);
  assert(out.size() == 1);
  assert(invalid == 1);

  const auto header = mural::wire::encode_header(0x01020304U);
  assert(header[0] == 0x01 && header[3] == 0x04);
  assert(mural::wire::decode_header(header) == 0x01020304U);
  assert(!mural::wire::encode_frame(std::string(mural::wire::kMaxFrameBytes + 1U, 'x')).has_value());

  const std::string response = mural::wire::make_response(
      mural::Result::failure(mural::ErrorKind::Unavailable, "down"), {{"extra", "line1\nline2"}});
  mural::wire::Fields fields;
  const mural::Result parsed = mural::wire::parse_response(response, fields);
  assert(!parsed.ok);
  assert(parsed.kind == mural::ErrorKind::Unavailable);
  assert(parsed.message == "down");
  assert(fields.at("extra") == "line1\nline2");

  std::string host;
  std::uint16_t port = 0;
  assert(mural::wire::split_host_port("127.0.0.1:5001", host, port));
  assert(host == "127.0.0.1" && port == 5001);
  assert(!mural::wire::split_host_port("127.0.0.1:99999", host, port));
  assert(!mural::wire::split_host_port("nohost", host, port));
}

void test_wire_pages() {
  mural::wire::Fields request;
  std::string after;
  std::size_t limit = 0;
  assert(mural::wire::read_page_request(request, after, limit).ok);
  assert(after.empty());
  assert(limit == mural::kDefaultPullPageLimit);

  request = {{"after", "n1-4"}, {"limit", "999999"}};
  assert(mural::wire::read_page_request(request, after, limit).ok);
  assert(after == "n1-4");
  assert(limit == mural::kMaxPullPageLimit);

  request = {{"limit", "ten"}};
  assert(mural::wire::read_page_request(request, after, limit).kind == mural::ErrorKind::InvalidInput);

  // Lines past the byte budget move to the next page.
  mural::SnapshotPage page;
  const std::string large(mural::wire::kPageBudgetBytes / 5, 'x');
  for (std::uint64_t i = 1; i <= 4; ++i) {
    page.messages.push_back(make_message("n1", i, i, large));
  }
  mural::wire::Fields fields;
  for (auto& [key, value] : mural::wire::page_fields(page)) {
    fields.emplace(key, value);
  }
  mural::SnapshotPage decoded;
  assert(mural::wire::read_page(fields, decoded).ok);
  assert(decoded.messages.size() == 2);
  assert(decoded.more);
  assert(fields.at("next") == "n1-2");

  page.messages.resize(1);
  fields.clear();
  for (auto& [key, value] : mural::wire::page_fields(page)) {
    fields.emplace(key, value);
  }
  assert(mural::wire::read_page(fields, decoded).ok);
  assert(decoded.messages.size() == 1);
  assert(!decoded.more);

  fields["messages"] = "not a record\n";
  assert(mural::wire::read_page(fields, decoded).kind == mural::ErrorKind::Protocol);
}

void test_auth_gate() {
  mural::SessionAuthGate gate(mural::parse_user_list("alice:password1, bob:password2,broken"));
  assert(gate.user_count() == 2);

  assert(gate.login("alice", "wrong").kind == mural::ErrorKind::Authorization);
  assert(gate.login("", "").kind == mural::ErrorKind::InvalidInput);

  const mural::Result login = gate.login("alice", "password1");
  assert(login.ok);
  assert(login.data.size() == 64);
  assert(gate.authorize(login.data) == std::optional<std::string>{"alice"});
  assert(!gate.authorize("not-a-token").has_value());
  assert(!gate.authorize("").has_value());

  const mural::Result second = gate.login("alice", "password1");
  assert(second.data != login.data);
  assert(gate.session_count() == 2);

  assert(gate.logout(login.data).ok);
  assert(!gate.authorize(login.data).has_value());
  assert(!gate.logout(login.data).ok);

  mural::SessionAuthGate admins(mural::parse_user_list("alice:password1,bob:password2"), {"alice"});
  assert(admins.is_admin("alice"));
  assert(!admins.is_admin("bob"));
  assert(!gate.is_admin("alice"));
}

}  // namespace

int main() {
  test_lamport_clock();
  test_store_insert_and_duplicates();
  test_store_merge_idempotent_and_commutative();
  test_store_ordered_view();
  test_store_pages_in_id_order();
  test_store_file_persistence();
  test_store_persistence_failure();
  test_peer_registry();
  test_node_config();
  test_backoff_schedule();
  test_message_codec_and_wire();
  test_wire_pages();
  test_auth_gate();

  std::cout << "mural_core_tests passed\n";
  return 0;
}
