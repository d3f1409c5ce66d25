#include "config.h"

#include "distributor_client.h"
#include "fs_pack_provider.h"
#include "json_util.h"
#include "log.h"
#include "remote_pack_provider.h"
#include "util.h"

#include <chrono>
#include <stdexcept>

namespace mosaic {

std::string const &app_config::tenant_for_domain(std::string_view domain) const {
  if (auto const it{ tenant_map.find(std::string{ domain }) }; it != tenant_map.end()) {
    return it->second;
  }
  return default_tenant;
}

std::string const &app_config::effective_tenant() const {
  return tenant ? *tenant : tenant_for_domain(domain);
}

std::unique_ptr<pack_provider> app_config::make_pack_provider() const {
  if (distributor.url.empty() || distributor.packs_json.empty()) {
    if (!distributor.url.empty() || !distributor.packs_json.empty()) {
      log::warn("distributor url and pack map must both be set; using pack root %s",
                pack_root.string().c_str());
    }
    log::debug("pack provider: filesystem at %s", pack_root.string().c_str());
    return std::make_unique<fs_pack_provider>(pack_root);
  }

  std::string const &env_id{ distributor.environment_id.empty()
                                 ? environment_id
                                 : distributor.environment_id };
  log::debug("pack provider: distributor at %s (env %s)",
             distributor.url.c_str(),
             env_id.c_str());

  return std::make_unique<remote_pack_provider>(
      std::make_shared<http_distributor_client>(distributor.url, distributor.token),
      env_id,
      remote_pack_refs_from_json(distributor.packs_json));
}

sandbox_limits app_config::make_sandbox_limits() const {
  sandbox_limits limits;
  if (fragment_timeout_ms) {
    if (*fragment_timeout_ms == 0) {
      throw std::invalid_argument("fragment timeout must be positive");
    }
    limits.deadline = std::chrono::milliseconds{ *fragment_timeout_ms };
  }
  if (fragment_memory_mb) {
    if (*fragment_memory_mb == 0) {
      throw std::invalid_argument("fragment memory limit must be positive");
    }
    limits.memory_bytes = std::size_t{ *fragment_memory_mb } * 1024u * 1024u;
  }
  return limits;
}

std::map<std::string, std::string> app_config_parse_tenant_map(std::string_view text) {
  std::map<std::string, std::string> result;
  if (util_trim(text).empty()) { return result; }

  auto const value{ json_parse(text, "tenant map") };
  for (auto const &[domain, tenant] : json_as_object(value, "tenant map")) {
    if (!tenant.is<std::string>()) {
      throw std::runtime_error("tenant map: value for '" + domain + "' must be a string");
    }
    result.emplace(domain, tenant.get<std::string>());
  }
  return result;
}

}  // namespace mosaic
