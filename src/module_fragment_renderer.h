#pragma once

#include "fragment_renderer.h"
#include "sandbox.h"

#include <filesystem>
#include <memory>

namespace mosaic {

// <assets_root>/fragments/<component_name>, with ".lua" appended when the name has no
// extension.
std::filesystem::path module_fragment_path(std::filesystem::path const &assets_root,
                                           fragment_binding const &binding);

// Renders bindings through sandboxed Lua modules. Errors mentioning "missing_secrets"
// become missing-secrets outcomes; every other module failure is a no-opinion.
class module_fragment_renderer : public fragment_renderer {
 public:
  explicit module_fragment_renderer(std::shared_ptr<module_engine> engine);

  render_outcome render(fragment_binding const &binding,
                        std::filesystem::path const &assets_root,
                        fragment_context const &ctx) override;

 private:
  std::shared_ptr<module_engine> engine_;
};

// Module renderer (when an engine is given) followed by the static file renderer.
std::shared_ptr<fragment_renderer> make_fragment_renderer(
    std::shared_ptr<module_engine> engine);

}  // namespace mosaic
