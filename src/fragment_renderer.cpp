#include "fragment_renderer.h"

#include "log.h"
#include "util.h"

#include <stdexcept>
#include <system_error>
#include <utility>

namespace mosaic {

render_outcome file_fragment_renderer::render(fragment_binding const &binding,
                                              std::filesystem::path const &assets_root,
                                              fragment_context const &) {
  auto const path{ assets_root / "fragments" / (binding.id + ".html") };

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    log::debug("fragment %s: no static file at %s", binding.id.c_str(), path.string().c_str());
    return fragment_no_opinion{};
  }

  try {
    return fragment_markup{ util_load_text_file(path) };
  } catch (std::runtime_error const &e) {
    return fragment_failed{ e.what() };
  }
}

composite_fragment_renderer::composite_fragment_renderer(
    std::vector<std::shared_ptr<fragment_renderer>> stages)
    : stages_{ std::move(stages) } {
  std::erase(stages_, nullptr);
}

render_outcome composite_fragment_renderer::render(fragment_binding const &binding,
                                                   std::filesystem::path const &assets_root,
                                                   fragment_context const &ctx) {
  for (auto const &stage : stages_) {
    auto outcome{ stage->render(binding, assets_root, ctx) };
    if (!std::holds_alternative<fragment_no_opinion>(outcome)) { return outcome; }
  }
  return fragment_no_opinion{};
}

}  // namespace mosaic
