#pragma once

#include "pack_provider.h"

#include <filesystem>

namespace mosaic {

// Reads packs from <pack_root>/<tenant>/<pack-dir>/gui/manifest.json. Pack directories are
// visited in lexicographic order.
class fs_pack_provider : public pack_provider {
 public:
  explicit fs_pack_provider(std::filesystem::path pack_root);

  layout_pack load_layout(std::string_view tenant) override;
  std::optional<auth_pack> load_auth(std::string_view tenant) override;
  std::optional<skin_pack> load_skin(std::string_view tenant) override;
  std::optional<telemetry_pack> load_telemetry(std::string_view tenant) override;
  std::vector<feature_pack> load_features(std::string_view tenant) override;
  void clear_cache() override {}

  std::filesystem::path const &pack_root() const { return pack_root_; }

 private:
  std::vector<gui_pack> load_kind(std::string_view tenant, pack_kind kind) const;

  std::filesystem::path pack_root_;
};

}  // namespace mosaic
