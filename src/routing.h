#pragma once

#include "session.h"
#include "tenant_config.h"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mosaic {

// Trims surrounding whitespace, collapses runs of '/', forces one leading '/'. Idempotent.
std::string normalize_route(std::string_view path);

// Exact match against the normalized pattern, or for "<prefix>/*" patterns, a match of
// <prefix> itself or anything below it at a '/' boundary. path must be normalized.
bool route_path_matches(std::string_view path, std::string_view pattern);

struct route_serve {
  std::string html;
  std::vector<fragment_target> fragments;
  std::optional<session_info> session;
};

struct route_redirect {
  std::string location;
};

using route_decision = std::variant<route_serve, route_redirect>;

// First auth route path, or "/login".
std::string login_target(tenant_gui_config const &cfg);

// Resolves path, validates the session and either redirects to login or loads the
// document. Throws when the document cannot be read.
route_decision decide_route(tenant_gui_config const &cfg,
                            std::string_view path,
                            std::optional<std::string> const &session_token,
                            session_manager &sessions);

}  // namespace mosaic
