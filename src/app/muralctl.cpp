#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/model/types.hpp"
#include "core/storage/message_store.hpp"
#include "core/transport/peer_transport.hpp"
#include "core/transport/tcp_client.hpp"
#include "core/transport/wire.hpp"

namespace {

constexpr auto kRequestTimeout = std::chrono::milliseconds(15000);

void print_usage() {
  std::cout << "usage: muralctl --connect host:port <command> [args]\n"
            << "commands:\n"
            << "  login <user> <password>          prints a session token\n"
            << "  logout <token>\n"
            << "  post <token> <text> [--as user]\n"
            << "  list\n"
            << "  offline <token> | online <token>  admin users only\n"
            << "  reconcile\n"
            << "  peers | status\n";
}

std::string field(const mural::wire::Fields& fields, std::string_view key) {
  const auto it = fields.find(std::string{key});
  return it == fields.end() ? std::string{} : it->second;
}

int report_failure(const mural::Result& result) {
  std::cerr << "error [" << mural::error_kind_to_string(result.kind) << "]: " << result.message << '\n';
  return 1;
}

// Reads the board page by page, then prints it in display order.
int list_board(const std::string& address) {
  std::vector<mural::Message> messages;
  const mural::Result collected = mural::collect_snapshot_pages(
      [&address](std::string_view after_id, mural::SnapshotPage& page) {
        std::string response;
        const mural::Result sent = mural::tcp_exchange(
            address, mural::wire::make_request("list", {{"after", std::string{after_id}}}), kRequestTimeout,
            response);
        if (!sent.ok) {
          return sent;
        }
        mural::wire::Fields reply;
        const mural::Result result = mural::wire::parse_response(response, reply);
        if (!result.ok) {
          return result;
        }
        return mural::wire::read_page(reply, page);
      },
      messages);
  if (!collected.ok) {
    return report_failure(collected);
  }

  std::ranges::sort(messages, mural::display_before);
  for (const auto& message : messages) {
    std::cout << "[" << message.logical_ts.counter << "@" << message.logical_ts.node_id << "] " << message.id
              << " " << message.author << ": " << message.content << '\n';
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.size() < 3 || args[0] != "--connect") {
    print_usage();
    return 2;
  }
  const std::string address = args[1];
  const std::string command = args[2];
  const std::vector<std::string> rest(args.begin() + 3, args.end());

  std::vector<std::pair<std::string, std::string>> fields;
  if (command == "login") {
    if (rest.size() != 2) {
      print_usage();
      return 2;
    }
    fields = {{"username", rest[0]}, {"password", rest[1]}};
  } else if (command == "logout" || command == "offline" || command == "online") {
    if (rest.size() != 1) {
      print_usage();
      return 2;
    }
    fields = {{"token", rest[0]}};
  } else if (command == "post") {
    if (rest.size() != 2 && !(rest.size() == 4 && rest[2] == "--as")) {
      print_usage();
      return 2;
    }
    fields = {{"token", rest[0]}, {"content", rest[1]}};
    if (rest.size() == 4) {
      fields.emplace_back("author", rest[3]);
    }
  } else if (command == "list") {
    return list_board(address);
  } else if (command != "reconcile" && command != "peers" && command != "status") {
    print_usage();
    return 2;
  }

  std::string response;
  const mural::Result sent =
      mural::tcp_exchange(address, mural::wire::make_request(command, std::move(fields)), kRequestTimeout, response);
  if (!sent.ok) {
    return report_failure(sent);
  }

  mural::wire::Fields reply;
  const mural::Result result = mural::wire::parse_response(response, reply);
  if (command == "reconcile" && (result.ok || result.kind == mural::ErrorKind::ReconciliationPartial)) {
    std::cout << "added " << field(reply, "added") << " message(s)";
    if (!field(reply, "unreachable").empty()) {
      std::cout << "; unreachable: " << field(reply, "unreachable");
    }
    std::cout << '\n';
    return result.ok ? 0 : 1;
  }
  if (!result.ok) {
    return report_failure(result);
  }

  if (command == "login") {
    std::cout << result.data << '\n';
  } else if (command == "post") {
    std::cout << "posted " << field(reply, "id") << " at " << field(reply, "counter") << '\n';
  } else if (command == "peers") {
    std::cout << "id\taddress\treachable\tfailures\n" << field(reply, "peers");
  } else if (command == "status") {
    std::vector<std::pair<std::string, std::string>> sorted(reply.begin(), reply.end());
    std::ranges::sort(sorted);
    for (const auto& [key, value] : sorted) {
      if (key != "ok" && key != "kind") {
        std::cout << key << ": " << value << '\n';
      }
    }
  } else {
    std::cout << result.message << '\n';
  }
  return 0;
}
