#include "core/auth/auth_gate.hpp"

#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace mural {
namespace {

constexpr std::size_t kTokenBytes = 32;

}  // namespace

std::vector<UserCredential> parse_user_list(std::string_view csv) {
  std::vector<UserCredential> users;
  for (const auto& entry : util::split_csv(csv)) {
    const auto colon = entry.find(':');
    if (colon == std::string::npos || colon == 0) {
      continue;
    }
    users.push_back({
        .username = util::trim_copy(std::string_view{entry}.substr(0, colon)),
        .password = std::string{std::string_view{entry}.substr(colon + 1U)},
    });
  }
  return users;
}

SessionAuthGate::SessionAuthGate(std::vector<UserCredential> users, std::vector<std::string> admins)
    : users_(std::move(users)), admins_(std::move(admins)) {}

Result SessionAuthGate::login(std::string_view username, std::string_view password) {
  if (username.empty() || password.empty()) {
    return Result::failure(ErrorKind::InvalidInput, "username and password required");
  }
  if (!util::sodium_ready()) {
    return Result::failure(ErrorKind::Unavailable, "libsodium initialization failed.");
  }

  bool matched = false;
  for (const auto& user : users_) {
    if (user.username == username && util::constant_time_equals(user.password, password)) {
      matched = true;
      break;
    }
  }
  if (!matched) {
    return Result::failure(ErrorKind::Authorization, "invalid credentials");
  }

  std::string token = util::random_token_hex(kTokenBytes);
  std::lock_guard lock(mutex_);
  sessions_.insert_or_assign(token, std::string{username});
  return Result::success("Logged in.", std::move(token));
}

Result SessionAuthGate::logout(std::string_view token) {
  std::lock_guard lock(mutex_);
  const auto it = sessions_.find(std::string{token});
  if (it == sessions_.end()) {
    return Result::failure(ErrorKind::Authorization, "Unknown session token.");
  }
  sessions_.erase(it);
  return Result::success("Logged out.");
}

std::optional<std::string> SessionAuthGate::authorize(std::string_view token) const {
  if (token.empty()) {
    return std::nullopt;
  }
  std::lock_guard lock(mutex_);
  const auto it = sessions_.find(std::string{token});
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool SessionAuthGate::is_admin(std::string_view principal) const {
  for (const auto& admin : admins_) {
    if (admin == principal) {
      return true;
    }
  }
  return false;
}

std::size_t SessionAuthGate::session_count() const {
  std::lock_guard lock(mutex_);
  return sessions_.size();
}

}  // namespace mural
