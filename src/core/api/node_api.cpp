#include "core/api/node_api.hpp"

#include <exception>

#include "core/model/app_meta.hpp"
#include "core/model/message_codec.hpp"
#include "core/node/node_state.hpp"
#include "core/util/canonical.hpp"

namespace mural {
namespace {

using Reply = std::vector<std::pair<std::string, std::string>>;

std::string field_or_empty(const wire::Fields& fields, std::string_view key) {
  const auto it = fields.find(std::string{key});
  return it == fields.end() ? std::string{} : it->second;
}

}  // namespace

std::string encode_peer_lines(const std::vector<PeerEntry>& peers) {
  std::string out;
  for (const auto& peer : peers) {
    out += peer.peer_id + '\t' + peer.address + '\t' + (peer.reachable ? "1" : "0") + '\t' +
           std::to_string(peer.consecutive_failures) + '\n';
  }
  return out;
}

std::string NodeApi::handle(std::string_view request) {
  Reply reply;
  Result result;
  try {
    result = dispatch(util::parse_canonical_map(request), reply);
  } catch (const std::exception& ex) {
    reply.clear();
    result = Result::failure(ErrorKind::Unavailable, std::string{"request failed: "} + ex.what());
  }
  return wire::make_response(result, std::move(reply));
}

Result NodeApi::dispatch(const wire::Fields& request, Reply& reply) {
  if (field_or_empty(request, "protocol") != kWireProtocol) {
    return Result::failure(ErrorKind::Protocol, "Unsupported protocol: " + field_or_empty(request, "protocol"));
  }

  const std::string op = field_or_empty(request, "op");
  if (op == "push") {
    return on_push(request);
  }
  if (op == "pull") {
    return on_pull(request, reply);
  }
  if (op == "login") {
    return node_.login(field_or_empty(request, "username"), field_or_empty(request, "password"));
  }
  if (op == "logout") {
    return node_.logout(field_or_empty(request, "token"));
  }
  if (op == "post") {
    return on_post(request, reply);
  }
  if (op == "list") {
    return on_list(request, reply);
  }
  if (op == "offline" || op == "online") {
    return on_connectivity(request, op == "online", reply);
  }
  if (op == "reconcile") {
    return on_reconcile(reply);
  }
  if (op == "peers") {
    return on_peers(reply);
  }
  if (op == "status") {
    return on_status(reply);
  }
  return Result::failure(ErrorKind::Protocol, "Unknown op: " + op);
}

Result NodeApi::on_push(const wire::Fields& request) {
  const auto message = decode_message_line(field_or_empty(request, "message"));
  if (!message.has_value()) {
    return Result::failure(ErrorKind::Protocol, "push carried an unreadable message record.");
  }
  return node_.endpoint()->handle_push(*message, field_or_empty(request, "from"));
}

Result NodeApi::on_pull(const wire::Fields& request, Reply& reply) {
  std::string after;
  std::size_t limit = 0;
  const Result paging = wire::read_page_request(request, after, limit);
  if (!paging.ok) {
    return paging;
  }

  SnapshotPage page;
  const Result pulled = node_.endpoint()->handle_pull(after, limit, page);
  if (pulled.ok) {
    reply = wire::page_fields(page);
  }
  return pulled;
}

Result NodeApi::on_post(const wire::Fields& request, Reply& reply) {
  Message created;
  const Result posted = node_.post_message(field_or_empty(request, "token"), field_or_empty(request, "author"),
                                           field_or_empty(request, "content"), &created);
  if (posted.ok) {
    reply.emplace_back("id", created.id);
    reply.emplace_back("author", created.author);
    reply.emplace_back("counter", std::to_string(created.logical_ts.counter));
    reply.emplace_back("origin", created.origin_node);
  }
  return posted;
}

// Pages run in id order; clients sort the collected board into display order.
Result NodeApi::on_list(const wire::Fields& request, Reply& reply) {
  std::string after;
  std::size_t limit = 0;
  const Result paging = wire::read_page_request(request, after, limit);
  if (!paging.ok) {
    return paging;
  }

  const SnapshotPage page = node_.list_page(after, limit);
  reply = wire::page_fields(page);
  reply.emplace_back("count", std::to_string(node_.store().size()));
  return Result::success("Messages.", std::to_string(page.messages.size()));
}

Result NodeApi::on_connectivity(const wire::Fields& request, bool online, Reply& reply) {
  const Result admin = node_.authorize_admin(field_or_empty(request, "token"));
  if (!admin.ok) {
    return admin;
  }
  if (!online) {
    return node_.go_offline();
  }
  ReconcileReport report;
  const Result result = node_.go_online(&report);
  reply.emplace_back("added", std::to_string(report.messages_added));
  return result;
}

Result NodeApi::on_reconcile(Reply& reply) {
  ReconcileReport report;
  const Result result = node_.reconcile_now(report);
  reply.emplace_back("added", std::to_string(report.messages_added));

  std::vector<std::string> unreachable;
  for (const auto& peer : report.peers) {
    if (!peer.reached) {
      unreachable.push_back(peer.peer_id);
    }
  }
  reply.emplace_back("unreachable", util::join_csv(unreachable));
  return result;
}

Result NodeApi::on_peers(Reply& reply) {
  const auto peers = node_.peers();
  reply.emplace_back("peers", encode_peer_lines(peers));
  return Result::success("Peers.", std::to_string(peers.size()));
}

Result NodeApi::on_status(Reply& reply) {
  const NodeStatusReport status = node_.status();
  std::size_t unreachable = 0;
  for (const auto& peer : status.peers) {
    unreachable += peer.reachable ? 0 : 1;
  }

  reply = {
      {"version", std::string{kAppVersion}},
      {"node_id", status.node_id},
      {"mode", connectivity_to_string(status.connectivity)},
      {"listen", status.listen_address},
      {"clock", std::to_string(status.clock_counter)},
      {"message_count", std::to_string(status.store.message_count)},
      {"digest", status.store.digest},
      {"log_path", status.store.log_path},
      {"invalid_records", std::to_string(status.store.invalid_record_count)},
      {"peer_count", std::to_string(status.peers.size())},
      {"unreachable_peers", std::to_string(unreachable)},
      {"pushes_delivered", std::to_string(status.replication.pushes_delivered)},
      {"push_failed_attempts", std::to_string(status.replication.failed_attempts)},
      {"pushes_abandoned", std::to_string(status.replication.pushes_abandoned)},
      {"pushes_suppressed_offline", std::to_string(status.replication.suppressed_offline)},
      {"pushes_dropped_queue_full", std::to_string(status.replication.dropped_queue_full)},
      {"reconcile_rounds", std::to_string(status.reconciliation.rounds)},
      {"reconcile_peer_failures", std::to_string(status.reconciliation.peer_failures)},
      {"messages_pulled", std::to_string(status.reconciliation.messages_pulled)},
  };
  return Result::success(status.store.healthy ? "Node healthy." : status.store.details);
}

}  // namespace mural
