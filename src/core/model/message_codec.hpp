#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace mural {

// One tab-separated line, newline excluded:
// id, origin_node, counter, clock node id, hex(author), hex(content).
std::string encode_message_line(const Message& message);
std::optional<Message> decode_message_line(std::string_view line);

// Newline-separated lines; blank lines and `#` comments are skipped.
bool decode_message_block(std::string_view block, std::vector<Message>& out,
                          std::size_t& out_invalid);

// Structural checks shared by local writes and replicated input.
bool is_well_formed(const Message& message);

}  // namespace mural
