#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace mural::util {

// Initializes libsodium once. The hashing and token helpers return an empty
// string when it is unavailable.
bool sodium_ready();

std::string blake2b_hex(std::string_view payload);
std::string random_token_hex(std::size_t bytes);
bool constant_time_equals(std::string_view lhs, std::string_view rhs);

}  // namespace mural::util
