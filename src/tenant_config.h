#pragma once

#include "pack.h"
#include "pack_provider.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mosaic {

struct pack_location {
  std::filesystem::path root;
  std::filesystem::path assets;  // <root>/gui/assets
  std::vector<secret_requirement> secret_requirements;
};

struct tenant_layout {
  layout_manifest manifest;
  pack_location location;
};

struct tenant_auth {
  auth_manifest manifest;
  pack_location location;
};

struct tenant_feature {
  feature_manifest manifest;
  pack_location location;
};

// A fragment binding paired with the asset root of the pack that declared it.
struct fragment_target {
  fragment_binding binding;
  std::filesystem::path assets_root;
};

enum class route_origin { layout, auth, feature };

struct resolved_route {
  route_origin origin{ route_origin::layout };
  std::filesystem::path document;
  bool authenticated{ false };
  std::vector<fragment_target> fragments;
};

struct tenant_gui_config {
  std::string tenant;
  std::string domain;
  tenant_layout layout;
  std::optional<tenant_auth> auth;
  std::optional<pack_location> skin;
  std::optional<pack_location> telemetry;
  std::vector<tenant_feature> features;  // route precedence order
  std::vector<secret_requirement> secret_requirements;

  // Throws when the provider has no layout for the tenant.
  static tenant_gui_config load(std::string_view tenant,
                                std::string_view domain,
                                pack_provider &provider);

  // Total: falls back to the layout entry document.
  resolved_route resolve_route(std::string_view path) const;
};

// {tenant, domain, routes:[{path, authenticated}], workers:[...], skin}
std::string tenant_gui_config_summary(tenant_gui_config const &cfg);

}  // namespace mosaic
