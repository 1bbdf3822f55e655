#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mural::util {

std::string lowercase_copy(std::string_view value);
std::string trim_copy(std::string_view value);

// Sorted `key=value\n` lines with '\n' and '\\' escaped in values.
std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields);
std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload);

std::vector<std::string> split_csv(std::string_view csv);
std::string join_csv(const std::vector<std::string>& values);

std::string to_hex(std::string_view bytes);
std::optional<std::string> from_hex(std::string_view hex);

std::optional<std::uint64_t> parse_uint64(std::string_view text);

}  // namespace mural::util
