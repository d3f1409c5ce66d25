#pragma once

#include "pack.h"

#include <optional>
#include <string_view>
#include <vector>

namespace mosaic {

// Source of GUI packs for a tenant. Implementations must be safe to call concurrently.
class pack_provider {
 public:
  virtual ~pack_provider() = default;

  // Exactly one layout; throws std::runtime_error when the tenant has none.
  virtual layout_pack load_layout(std::string_view tenant) = 0;
  virtual std::optional<auth_pack> load_auth(std::string_view tenant) = 0;
  virtual std::optional<skin_pack> load_skin(std::string_view tenant) = 0;
  virtual std::optional<telemetry_pack> load_telemetry(std::string_view tenant) = 0;

  // Ordered; the order determines route precedence.
  virtual std::vector<feature_pack> load_features(std::string_view tenant) = 0;

  virtual void clear_cache() = 0;
};

}  // namespace mosaic
