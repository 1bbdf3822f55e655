#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/model/types.hpp"

namespace mural {

// Capability check in front of client writes: a token either maps to a
// principal or is refused.
class IAuthGate {
public:
  virtual ~IAuthGate() = default;

  [[nodiscard]] virtual std::optional<std::string> authorize(std::string_view token) const = 0;
};

struct UserCredential {
  std::string username;
  std::string password;
};

// `name:password` entries, comma separated.
std::vector<UserCredential> parse_user_list(std::string_view csv);

class SessionAuthGate final : public IAuthGate {
public:
  // `admins` name users allowed to drive node control ops.
  explicit SessionAuthGate(std::vector<UserCredential> users, std::vector<std::string> admins = {});

  // On success `data` carries the bearer token.
  Result login(std::string_view username, std::string_view password);
  Result logout(std::string_view token);

  [[nodiscard]] std::optional<std::string> authorize(std::string_view token) const override;
  [[nodiscard]] bool is_admin(std::string_view principal) const;
  [[nodiscard]] std::size_t session_count() const;
  [[nodiscard]] std::size_t user_count() const { return users_.size(); }

private:
  std::vector<UserCredential> users_;
  std::vector<std::string> admins_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::string> sessions_;
};

}  // namespace mural
