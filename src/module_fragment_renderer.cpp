#include "module_fragment_renderer.h"

#include "log.h"

#include <stdexcept>
#include <system_error>
#include <utility>

namespace mosaic {

namespace {

constexpr std::string_view kMissingSecretsMarker{ "missing_secrets" };

}  // namespace

std::filesystem::path module_fragment_path(std::filesystem::path const &assets_root,
                                           fragment_binding const &binding) {
  std::filesystem::path name{ binding.component_name };
  if (!name.has_extension()) { name += ".lua"; }
  return assets_root / "fragments" / name;
}

module_fragment_renderer::module_fragment_renderer(std::shared_ptr<module_engine> engine)
    : engine_{ std::move(engine) } {
  if (!engine_) { throw std::invalid_argument("module_fragment_renderer: engine is null"); }
}

render_outcome module_fragment_renderer::render(fragment_binding const &binding,
                                                std::filesystem::path const &assets_root,
                                                fragment_context const &ctx) {
  auto const path{ module_fragment_path(assets_root, binding) };

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    log::debug("fragment %s: no module at %s", binding.id.c_str(), path.string().c_str());
    return fragment_no_opinion{};
  }

  try {
    auto const module{ engine_->load(path) };
    return fragment_markup{ engine_->invoke(*module,
                                            { .fragment_id = binding.id,
                                              .component_world = binding.component_world,
                                              .ctx = ctx }) };
  } catch (std::runtime_error const &e) {
    std::string const message{ e.what() };
    if (message.find(kMissingSecretsMarker) != std::string::npos) {
      return fragment_missing_secrets{ message };
    }
    log::warn("fragment %s: module %s failed: %s",
              binding.id.c_str(),
              path.string().c_str(),
              message.c_str());
    return fragment_no_opinion{};
  }
}

std::shared_ptr<fragment_renderer> make_fragment_renderer(
    std::shared_ptr<module_engine> engine) {
  std::vector<std::shared_ptr<fragment_renderer>> stages;
  if (engine) {
    stages.push_back(std::make_shared<module_fragment_renderer>(std::move(engine)));
  }
  stages.push_back(std::make_shared<file_fragment_renderer>());
  return std::make_shared<composite_fragment_renderer>(std::move(stages));
}

}  // namespace mosaic
