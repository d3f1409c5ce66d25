#pragma once

#include "pack_provider.h"
#include "sandbox.h"

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mosaic {

struct distributor_settings {
  std::string url;
  std::string environment_id;  // empty: use app_config::environment_id
  std::string token;
  std::string packs_json;  // kind -> {pack_id, component_id, version}
};

struct app_config {
  std::filesystem::path pack_root{ "packs" };
  std::string default_tenant{ "tenant-default" };
  std::map<std::string, std::string> tenant_map;  // domain -> tenant
  std::string environment_id{ "dev" };
  distributor_settings distributor;
  std::optional<unsigned> fragment_timeout_ms;
  std::optional<unsigned> fragment_memory_mb;
  std::string domain;
  std::optional<std::string> tenant;  // overrides the domain mapping

  std::string const &tenant_for_domain(std::string_view domain) const;

  // The explicit tenant if set, else tenant_for_domain(domain).
  std::string const &effective_tenant() const;

  // Distributor-backed when both the distributor url and pack map are set, otherwise the
  // filesystem provider rooted at pack_root.
  std::unique_ptr<pack_provider> make_pack_provider() const;

  // Throws std::invalid_argument for zero limits.
  sandbox_limits make_sandbox_limits() const;
};

// Parses a JSON object of domain -> tenant. Throws std::runtime_error.
std::map<std::string, std::string> app_config_parse_tenant_map(std::string_view text);

}  // namespace mosaic
