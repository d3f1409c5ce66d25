#pragma once

#include <optional>
#include <string>
#include <utility>

namespace mosaic {

struct session_info {
  std::string session_id;
  std::string tenant;
  std::optional<std::string> user_id;
};

// Session validation is owned by the HTTP layer; routing only consumes this contract.
class session_manager {
 public:
  virtual ~session_manager() = default;

  // nullopt when the token is absent, unknown or expired. Throws on backend failure.
  virtual std::optional<session_info> validate(std::optional<std::string> const &token) = 0;
};

// Accepts every non-empty token as its own session id. For the command line front end
// and tests.
class trusting_session_manager : public session_manager {
 public:
  trusting_session_manager(std::string tenant, std::optional<std::string> user_id)
      : tenant_{ std::move(tenant) }, user_id_{ std::move(user_id) } {}

  std::optional<session_info> validate(std::optional<std::string> const &token) override {
    if (!token || token->empty()) { return std::nullopt; }
    return session_info{ .session_id = *token, .tenant = tenant_, .user_id = user_id_ };
  }

 private:
  std::string tenant_;
  std::optional<std::string> user_id_;
};

}  // namespace mosaic
