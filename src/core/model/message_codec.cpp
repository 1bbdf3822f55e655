#include "core/model/message_codec.hpp"

#include <array>
#include <sstream>

#include "core/util/canonical.hpp"

namespace mural {
namespace {

constexpr std::size_t kFieldCount = 6;

bool has_separator(std::string_view text) {
  return text.find('\t') != std::string_view::npos || text.find('\n') != std::string_view::npos;
}

}  // namespace

std::string encode_message_line(const Message& message) {
  std::ostringstream out;
  out << message.id << '\t' << message.origin_node << '\t' << message.logical_ts.counter << '\t'
      << message.logical_ts.node_id << '\t' << util::to_hex(message.author) << '\t'
      << util::to_hex(message.content);
  return out.str();
}

std::optional<Message> decode_message_line(std::string_view line) {
  std::array<std::string_view, kFieldCount> fields{};
  std::size_t field_index = 0;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= line.size(); ++i) {
    if (i == line.size() || line[i] == '\t') {
      if (field_index >= fields.size()) {
        return std::nullopt;
      }
      fields[field_index++] = line.substr(start, i - start);
      start = i + 1U;
    }
  }

  if (field_index != fields.size()) {
    return std::nullopt;
  }

  const auto counter = util::parse_uint64(fields[2]);
  const auto author = util::from_hex(fields[4]);
  const auto content = util::from_hex(fields[5]);
  if (!counter || !author || !content) {
    return std::nullopt;
  }

  Message message{
      .id = std::string{fields[0]},
      .author = *author,
      .content = *content,
      .logical_ts = {.counter = *counter, .node_id = std::string{fields[3]}},
      .origin_node = std::string{fields[1]},
  };
  if (!is_well_formed(message)) {
    return std::nullopt;
  }
  return message;
}

bool decode_message_block(std::string_view block, std::vector<Message>& out,
                          std::size_t& out_invalid) {
  out_invalid = 0;
  std::size_t start = 0;
  while (start < block.size()) {
    std::size_t end = block.find('\n', start);
    if (end == std::string_view::npos) {
      end = block.size();
    }
    const std::string_view line = block.substr(start, end - start);
    start = end + 1U;

    if (line.empty() || line.front() == '#') {
      continue;
    }

    if (auto message = decode_message_line(line)) {
      out.push_back(std::move(*message));
    } else {
      ++out_invalid;
    }
  }
  return out_invalid == 0;
}

bool is_well_formed(const Message& message) {
  if (message.id.empty() || message.origin_node.empty() || message.logical_ts.node_id.empty()) {
    return false;
  }
  if (message.logical_ts.counter == 0) {
    return false;
  }
  return !has_separator(message.id) && !has_separator(message.origin_node) &&
         !has_separator(message.logical_ts.node_id);
}

}  // namespace mural
