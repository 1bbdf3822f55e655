#include "core/util/canonical.hpp"

#include <algorithm>
#include <charconv>
#include <cctype>
#include <ranges>

namespace mural::util {
namespace {

int from_hex_digit(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

}  // namespace

std::string lowercase_copy(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  std::ranges::transform(value, std::back_inserter(out), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::string trim_copy(std::string_view value) {
  std::size_t begin = 0;
  while (begin < value.size() && std::isspace(static_cast<unsigned char>(value[begin])) != 0) {
    ++begin;
  }

  std::size_t end = value.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
    --end;
  }

  return std::string{value.substr(begin, end - begin)};
}

std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields) {
  std::ranges::sort(fields, [](const auto& lhs, const auto& rhs) {
    return lhs.first < rhs.first;
  });

  std::string payload;
  for (const auto& [key, value] : fields) {
    payload.append(key);
    payload.push_back('=');
    for (char c : value) {
      if (c == '\n') {
        payload.append("\\n");
      } else if (c == '\\') {
        payload.append("\\\\");
      } else {
        payload.push_back(c);
      }
    }
    payload.push_back('\n');
  }

  return payload;
}

std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload) {
  std::unordered_map<std::string, std::string> parsed;

  std::string key;
  std::string value;
  key.reserve(64);
  value.reserve(payload.size());

  bool reading_key = true;
  bool escaping = false;
  for (char c : payload) {
    if (reading_key) {
      if (c == '=') {
        reading_key = false;
        continue;
      }
      if (c == '\n') {
        key.clear();
        continue;
      }
      key.push_back(c);
      continue;
    }

    if (escaping) {
      value.push_back(c == 'n' ? '\n' : c);
      escaping = false;
      continue;
    }

    if (c == '\\') {
      escaping = true;
      continue;
    }

    if (c == '\n') {
      if (!key.empty()) {
        parsed.insert_or_assign(key, value);
      }
      key.clear();
      value.clear();
      reading_key = true;
      continue;
    }

    value.push_back(c);
  }

  if (!reading_key && !key.empty()) {
    parsed.insert_or_assign(key, value);
  }

  return parsed;
}

std::vector<std::string> split_csv(std::string_view csv) {
  std::vector<std::string> values;
  std::string current;
  for (char c : csv) {
    if (c == ',') {
      std::string trimmed = trim_copy(current);
      if (!trimmed.empty()) {
        values.push_back(std::move(trimmed));
      }
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  std::string trimmed = trim_copy(current);
  if (!trimmed.empty()) {
    values.push_back(std::move(trimmed));
  }
  return values;
}

std::string join_csv(const std::vector<std::string>& values) {
  std::string out;
  for (const auto& value : values) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out.append(value);
  }
  return out;
}

std::string to_hex(std::string_view bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2U);
  for (unsigned char c : bytes) {
    out.push_back(kHex[(c >> 4U) & 0x0FU]);
    out.push_back(kHex[c & 0x0FU]);
  }
  return out;
}

std::optional<std::string> from_hex(std::string_view hex) {
  if ((hex.size() % 2U) != 0U) {
    return std::nullopt;
  }

  std::string out;
  out.reserve(hex.size() / 2U);
  for (std::size_t i = 0; i < hex.size(); i += 2U) {
    const int hi = from_hex_digit(hex[i]);
    const int lo = from_hex_digit(hex[i + 1U]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<char>((hi << 4U) | lo));
  }
  return out;
}

std::optional<std::uint64_t> parse_uint64(std::string_view text) {
  std::uint64_t value = 0;
  const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
  if (result.ec != std::errc() || result.ptr != text.data() + text.size() || text.empty()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace mural::util
