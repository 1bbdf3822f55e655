#include "core/util/hash.hpp"

#include <array>
#include <mutex>
#include <string>

#include <sodium.h>

#include "core/util/canonical.hpp"

namespace mural::util {

bool sodium_ready() {
  static std::once_flag once;
  static bool ready = false;
  std::call_once(once, [] { ready = sodium_init() >= 0; });
  return ready;
}

std::string blake2b_hex(std::string_view payload) {
  if (!sodium_ready()) {
    return {};
  }
  std::array<unsigned char, crypto_generichash_BYTES> digest{};
  crypto_generichash(digest.data(), digest.size(),
                     reinterpret_cast<const unsigned char*>(payload.data()),
                     static_cast<unsigned long long>(payload.size()), nullptr, 0);
  return to_hex(std::string_view{reinterpret_cast<const char*>(digest.data()), digest.size()});
}

std::string random_token_hex(std::size_t bytes) {
  if (!sodium_ready()) {
    return {};
  }
  std::string raw(bytes, '\0');
  randombytes_buf(raw.data(), raw.size());
  return to_hex(raw);
}

bool constant_time_equals(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  if (lhs.empty()) {
    return true;
  }
  return sodium_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

}  // namespace mural::util
