#pragma once

#include "pack.h"

#include <filesystem>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace mosaic {

constexpr char kAnonymousUser[]{ "{}" };

struct fragment_context {
  std::string tenant_ctx;
  std::string user_ctx;  // user id, or kAnonymousUser
  std::string route;
  std::string session_id;  // empty without a session
};

struct fragment_markup {
  std::string html;
};

// The renderer has nothing for this binding; the next stage may try.
struct fragment_no_opinion {};

struct fragment_missing_secrets {
  std::string message;
};

struct fragment_failed {
  std::string message;
};

using render_outcome =
    std::variant<fragment_markup, fragment_no_opinion, fragment_missing_secrets, fragment_failed>;

class fragment_renderer {
 public:
  virtual ~fragment_renderer() = default;

  // Must be safe to call concurrently.
  virtual render_outcome render(fragment_binding const &binding,
                                std::filesystem::path const &assets_root,
                                fragment_context const &ctx) = 0;
};

// Serves <assets_root>/fragments/<binding id>.html.
class file_fragment_renderer : public fragment_renderer {
 public:
  render_outcome render(fragment_binding const &binding,
                        std::filesystem::path const &assets_root,
                        fragment_context const &ctx) override;
};

// Tries each stage in order; only a no-opinion outcome falls through to the next stage.
class composite_fragment_renderer : public fragment_renderer {
 public:
  explicit composite_fragment_renderer(
      std::vector<std::shared_ptr<fragment_renderer>> stages);

  render_outcome render(fragment_binding const &binding,
                        std::filesystem::path const &assets_root,
                        fragment_context const &ctx) override;

 private:
  std::vector<std::shared_ptr<fragment_renderer>> stages_;
};

}  // namespace mosaic
