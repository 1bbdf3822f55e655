#include "core/transport/tcp_transport.hpp"

#include "core/model/message_codec.hpp"
#include "core/transport/tcp_client.hpp"
#include "core/transport/wire.hpp"

namespace mural {

Result TcpPeerTransport::push_message(const PeerEntry& peer, std::string_view from_node,
                                      const Message& message, std::chrono::milliseconds timeout) {
  const std::string request = wire::make_request(
      "push", {{"from", std::string{from_node}}, {"message", encode_message_line(message)}});

  std::string response;
  const Result sent = tcp_exchange(peer.address, request, timeout, response);
  if (!sent.ok) {
    return sent;
  }

  wire::Fields fields;
  return wire::parse_response(response, fields);
}

Result TcpPeerTransport::pull_snapshot(const PeerEntry& peer, std::chrono::milliseconds timeout,
                                       std::vector<Message>& out) {
  // Each page gets the full timeout; a large store takes several frames.
  return collect_snapshot_pages(
      [&](std::string_view after_id, SnapshotPage& page) {
        std::string response;
        const std::string request = wire::make_request(
            "pull", {{"after", std::string{after_id}},
                     {"limit", std::to_string(kDefaultPullPageLimit)}});
        const Result sent = tcp_exchange(peer.address, request, timeout, response);
        if (!sent.ok) {
          return sent;
        }
        wire::Fields fields;
        const Result answer = wire::parse_response(response, fields);
        if (!answer.ok) {
          return answer;
        }
        const Result decoded = wire::read_page(fields, page);
        if (!decoded.ok) {
          return Result::failure(ErrorKind::Protocol,
                                 "Snapshot from " + peer.peer_id + ": " + decoded.message);
        }
        return decoded;
      },
      out);
}

}  // namespace mural
