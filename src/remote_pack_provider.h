#pragma once

#include "distributor_client.h"
#include "pack_provider.h"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mosaic {

struct remote_pack_ref {
  std::string pack_id;
  std::string component_id;
  std::string version;
};

using remote_pack_refs = std::map<pack_kind, remote_pack_ref>;

// Parses an operator JSON object mapping kind names ("layout" or "gui-layout") to
// {pack_id, component_id, version}. Unknown kind names are skipped.
remote_pack_refs remote_pack_refs_from_json(std::string_view text);

// Resolves packs through a distributor and memoizes the materialized local path per
// (tenant, kind) until clear_cache().
class remote_pack_provider : public pack_provider {
 public:
  remote_pack_provider(std::shared_ptr<distributor_client> client,
                       std::string environment_id,
                       remote_pack_refs packs);

  layout_pack load_layout(std::string_view tenant) override;
  std::optional<auth_pack> load_auth(std::string_view tenant) override;
  std::optional<skin_pack> load_skin(std::string_view tenant) override;
  std::optional<telemetry_pack> load_telemetry(std::string_view tenant) override;
  std::vector<feature_pack> load_features(std::string_view tenant) override;
  void clear_cache() override;

  // Local pack root for (tenant, kind), or nullopt when the kind is not configured.
  std::optional<std::filesystem::path> resolve(std::string_view tenant, pack_kind kind);

 private:
  std::optional<gui_pack> load_pack(std::string_view tenant, pack_kind kind);
  std::filesystem::path materialize(artifact_location const &location) const;

  std::shared_ptr<distributor_client> client_;
  std::string environment_id_;
  remote_pack_refs packs_;

  std::mutex cache_mutex_;
  std::unordered_map<std::string, std::filesystem::path> cache_;
};

// Fetches an image reference into <tmp>/mosaic-pack-<random>/artifact.tar and extracts it
// in place. Credentials come from MOSAIC_IMAGE_BEARER, or MOSAIC_IMAGE_USERNAME plus
// MOSAIC_IMAGE_PASSWORD.
std::filesystem::path remote_pack_download_image(std::string const &reference);

}  // namespace mosaic
