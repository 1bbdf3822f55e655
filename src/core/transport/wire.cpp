#include "core/transport/wire.hpp"

#include "core/model/app_meta.hpp"
#include "core/model/message_codec.hpp"
#include "core/transport/peer_transport.hpp"
#include "core/util/canonical.hpp"

namespace mural::wire {

std::array<unsigned char, kHeaderBytes> encode_header(std::uint32_t length) {
  return {
      static_cast<unsigned char>((length >> 24U) & 0xFFU),
      static_cast<unsigned char>((length >> 16U) & 0xFFU),
      static_cast<unsigned char>((length >> 8U) & 0xFFU),
      static_cast<unsigned char>(length & 0xFFU),
  };
}

std::uint32_t decode_header(const std::array<unsigned char, kHeaderBytes>& header) {
  return (static_cast<std::uint32_t>(header[0]) << 24U) |
         (static_cast<std::uint32_t>(header[1]) << 16U) |
         (static_cast<std::uint32_t>(header[2]) << 8U) | static_cast<std::uint32_t>(header[3]);
}

std::optional<std::string> encode_frame(std::string_view payload) {
  if (payload.size() > kMaxFrameBytes) {
    return std::nullopt;
  }
  const auto header = encode_header(static_cast<std::uint32_t>(payload.size()));
  std::string frame(header.begin(), header.end());
  frame.append(payload);
  return frame;
}

std::string make_request(std::string_view op,
                         std::vector<std::pair<std::string, std::string>> fields) {
  fields.emplace_back("op", std::string{op});
  fields.emplace_back("protocol", std::string{kWireProtocol});
  return util::canonical_join(std::move(fields));
}

std::string make_response(const Result& result,
                          std::vector<std::pair<std::string, std::string>> fields) {
  fields.emplace_back("ok", result.ok ? "1" : "0");
  fields.emplace_back("kind", error_kind_to_string(result.kind));
  fields.emplace_back("message", result.message);
  if (!result.data.empty()) {
    fields.emplace_back("data", result.data);
  }
  return util::canonical_join(std::move(fields));
}

Result parse_response(std::string_view payload, Fields& out_fields) {
  out_fields = util::parse_canonical_map(payload);

  const auto ok_it = out_fields.find("ok");
  if (ok_it == out_fields.end()) {
    return Result::failure(ErrorKind::Protocol, "Response is missing the ok field.");
  }

  const std::string message = out_fields.contains("message") ? out_fields.at("message") : "";
  if (ok_it->second == "1") {
    return Result::success(message, out_fields.contains("data") ? out_fields.at("data") : "");
  }

  const ErrorKind kind =
      out_fields.contains("kind") ? error_kind_from_string(out_fields.at("kind")) : ErrorKind::Protocol;
  return Result::failure(kind == ErrorKind::None ? ErrorKind::Protocol : kind, message);
}

std::vector<std::pair<std::string, std::string>> page_fields(const SnapshotPage& page) {
  std::string block;
  std::string next;
  std::size_t sent = 0;
  for (const auto& message : page.messages) {
    std::string line = encode_message_line(message);
    if (sent > 0 && block.size() + line.size() + 1U > kPageBudgetBytes) {
      break;
    }
    block += line;
    block.push_back('\n');
    next = message.id;
    ++sent;
  }
  const bool more = page.more || sent < page.messages.size();
  return {{"messages", std::move(block)}, {"more", more ? "1" : "0"}, {"next", std::move(next)}};
}

Result read_page(const Fields& fields, SnapshotPage& out) {
  out.messages.clear();
  std::size_t invalid = 0;
  const auto messages = fields.find("messages");
  if (messages != fields.end()) {
    decode_message_block(messages->second, out.messages, invalid);
  }
  if (invalid > 0) {
    return Result::failure(ErrorKind::Protocol,
                           "page had " + std::to_string(invalid) + " malformed records.");
  }
  const auto more = fields.find("more");
  out.more = more != fields.end() && more->second == "1";
  return Result::success("Page received.", std::to_string(out.messages.size()));
}

Result read_page_request(const Fields& fields, std::string& out_after, std::size_t& out_limit) {
  const auto after = fields.find("after");
  out_after = after == fields.end() ? std::string{} : after->second;
  out_limit = kDefaultPullPageLimit;

  const auto limit = fields.find("limit");
  if (limit == fields.end() || limit->second.empty()) {
    return Result::success();
  }
  const auto parsed = util::parse_uint64(limit->second);
  if (!parsed || *parsed == 0) {
    return Result::failure(ErrorKind::InvalidInput, "limit must be a positive integer.");
  }
  out_limit = *parsed > kMaxPullPageLimit ? kMaxPullPageLimit : static_cast<std::size_t>(*parsed);
  return Result::success();
}

bool split_host_port(std::string_view address, std::string& out_host, std::uint16_t& out_port) {
  const std::string trimmed = util::trim_copy(address);
  const auto colon = trimmed.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1U >= trimmed.size()) {
    return false;
  }

  const auto port = util::parse_uint64(std::string_view{trimmed}.substr(colon + 1U));
  if (!port || *port == 0 || *port > 65535U) {
    return false;
  }

  out_host = trimmed.substr(0, colon);
  out_port = static_cast<std::uint16_t>(*port);
  return true;
}

}  // namespace mural::wire
