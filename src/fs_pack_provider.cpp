#include "fs_pack_provider.h"

#include "log.h"

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace mosaic {

namespace {

std::vector<std::filesystem::path> list_pack_dirs(std::filesystem::path const &tenant_root) {
  std::vector<std::filesystem::path> dirs;

  std::error_code ec;
  if (!std::filesystem::is_directory(tenant_root, ec)) { return dirs; }

  std::filesystem::directory_iterator it{ tenant_root, ec };
  if (ec) {
    throw std::runtime_error("failed to list packs in " + tenant_root.string() + ": " +
                             ec.message());
  }

  for (auto const &entry : it) {
    if (entry.is_directory(ec)) { dirs.push_back(entry.path()); }
  }

  std::ranges::sort(dirs, [](auto const &a, auto const &b) {
    return a.filename().string() < b.filename().string();
  });
  return dirs;
}

template <typename T>
std::optional<T> first_of(std::vector<gui_pack> packs) {
  if (packs.empty()) { return std::nullopt; }
  return std::get<T>(std::move(packs.front()));
}

}  // namespace

fs_pack_provider::fs_pack_provider(std::filesystem::path pack_root)
    : pack_root_{ std::move(pack_root) } {}

std::vector<gui_pack> fs_pack_provider::load_kind(std::string_view tenant,
                                                  pack_kind kind) const {
  std::vector<gui_pack> packs;

  for (auto const &dir : list_pack_dirs(pack_root_ / tenant)) {
    auto const manifest{ pack_manifest_load(dir) };
    if (auto pack{ gui_pack_from_manifest(manifest, kind, dir) }) {
      packs.push_back(std::move(*pack));
    } else {
      log::debug("skipping %s for %s: not a %s pack",
                 dir.string().c_str(),
                 std::string(tenant).c_str(),
                 pack_kind_name(kind));
    }
  }

  return packs;
}

layout_pack fs_pack_provider::load_layout(std::string_view tenant) {
  auto layout{ first_of<layout_pack>(load_kind(tenant, pack_kind::layout)) };
  if (!layout) {
    throw std::runtime_error("no layout pack for tenant " + std::string(tenant) + " under " +
                             (pack_root_ / tenant).string());
  }
  return std::move(*layout);
}

std::optional<auth_pack> fs_pack_provider::load_auth(std::string_view tenant) {
  return first_of<auth_pack>(load_kind(tenant, pack_kind::auth));
}

std::optional<skin_pack> fs_pack_provider::load_skin(std::string_view tenant) {
  return first_of<skin_pack>(load_kind(tenant, pack_kind::skin));
}

std::optional<telemetry_pack> fs_pack_provider::load_telemetry(std::string_view tenant) {
  return first_of<telemetry_pack>(load_kind(tenant, pack_kind::telemetry));
}

std::vector<feature_pack> fs_pack_provider::load_features(std::string_view tenant) {
  std::vector<feature_pack> features;
  for (auto &pack : load_kind(tenant, pack_kind::feature)) {
    features.push_back(std::get<feature_pack>(std::move(pack)));
  }
  return features;
}

}  // namespace mosaic
