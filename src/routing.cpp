#include "routing.h"

#include "log.h"
#include "util.h"

#include <stdexcept>
#include <utility>

namespace mosaic {

std::string normalize_route(std::string_view path) {
  std::string_view const trimmed{ util_trim(path) };

  std::string result;
  result.reserve(trimmed.size() + 1);
  result.push_back('/');
  for (char const c : trimmed) {
    if (c == '/' && result.back() == '/') { continue; }
    result.push_back(c);
  }
  return result;
}

bool route_path_matches(std::string_view path, std::string_view pattern) {
  if (pattern.ends_with("/*")) {
    std::string const prefix{ normalize_route(pattern.substr(0, pattern.size() - 2)) };
    if (prefix == "/") { return true; }
    if (!path.starts_with(prefix)) { return false; }
    return path.size() == prefix.size() || path[prefix.size()] == '/';
  }
  return normalize_route(pattern) == path;
}

std::string login_target(tenant_gui_config const &cfg) {
  if (cfg.auth && !cfg.auth->manifest.routes.empty()) {
    return cfg.auth->manifest.routes.front().path;
  }
  return "/login";
}

route_decision decide_route(tenant_gui_config const &cfg,
                            std::string_view path,
                            std::optional<std::string> const &session_token,
                            session_manager &sessions) {
  auto resolved{ cfg.resolve_route(path) };
  auto session{ sessions.validate(session_token) };

  if (resolved.authenticated && !session) {
    auto target{ login_target(cfg) };
    log::debug("route %s requires a session; redirecting to %s",
               std::string(path).c_str(),
               target.c_str());
    return route_redirect{ .location = std::move(target) };
  }

  std::string html;
  try {
    html = util_load_text_file(resolved.document);
  } catch (std::runtime_error const &e) {
    throw std::runtime_error("reading html " + resolved.document.string() + ": " + e.what());
  }

  return route_serve{ .html = std::move(html),
                      .fragments = std::move(resolved.fragments),
                      .session = std::move(session) };
}

}  // namespace mosaic
