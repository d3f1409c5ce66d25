#pragma once

#include "fragment_renderer.h"
#include "session.h"
#include "tenant_config.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mosaic {

std::string fragment_placeholder(std::string_view fragment_id, std::string_view message);

// Renders every target concurrently and grafts the results into html in target order.
// Returns html unchanged (byte for byte) when no fragment was applied. Throws only when
// the renderer machinery itself cannot run; individual fragment failures become inline
// placeholders.
std::string inject_fragments(std::string html,
                             std::vector<fragment_target> const &targets,
                             std::optional<session_info> const &session,
                             std::string_view tenant,
                             std::string_view route,
                             fragment_renderer &renderer);

}  // namespace mosaic
