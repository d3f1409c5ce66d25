#include "remote_pack_provider.h"

#include "extract.h"
#include "json_util.h"
#include "log.h"
#include "util.h"

#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace mosaic {

namespace {

std::string env_or_empty(char const *name) {
  char const *value{ std::getenv(name) };
  return value ? std::string{ value } : std::string{};
}

libcurl_auth image_auth_from_env() {
  libcurl_auth auth{ .bearer_token = env_or_empty("MOSAIC_IMAGE_BEARER") };
  if (!auth.bearer_token.empty()) { return auth; }

  std::string user{ env_or_empty("MOSAIC_IMAGE_USERNAME") };
  std::string pass{ env_or_empty("MOSAIC_IMAGE_PASSWORD") };
  if (!user.empty() && !pass.empty()) {
    auth.username = std::move(user);
    auth.password = std::move(pass);
  } else if (!user.empty() || !pass.empty()) {
    log::warn(
        "MOSAIC_IMAGE_USERNAME or MOSAIC_IMAGE_PASSWORD set without both values; continuing "
        "unauthenticated");
  }
  return auth;
}

}  // namespace

remote_pack_refs remote_pack_refs_from_json(std::string_view text) {
  constexpr std::string_view ctx{ "distributor pack map" };

  remote_pack_refs refs;
  auto const root{ json_parse(text, ctx) };
  for (auto const &[name, value] : json_as_object(root, ctx)) {
    auto const kind{ pack_kind_parse(name) };
    if (!kind) {
      log::debug("distributor pack map: ignoring unknown kind '%s'", name.c_str());
      continue;
    }

    std::string const entry_ctx{ std::string(ctx) + "." + name };
    auto const &entry{ json_as_object(value, entry_ctx) };
    refs[*kind] = remote_pack_ref{
      .pack_id = json_get_required<std::string>(entry, "pack_id", entry_ctx),
      .component_id = json_get_required<std::string>(entry, "component_id", entry_ctx),
      .version = json_get_required<std::string>(entry, "version", entry_ctx),
    };
  }
  return refs;
}

std::filesystem::path remote_pack_download_image(std::string const &reference) {
  scoped_path_cleanup tmp_dir{ util_make_temp_dir("mosaic-pack") };
  auto const archive_path{ tmp_dir.path() / "artifact.tar" };

  log::info("downloading pack artifact %s", reference.c_str());
  libcurl_download(reference, archive_path, image_auth_from_env());
  extract_tar(archive_path, tmp_dir.path());

  return tmp_dir.release();
}

remote_pack_provider::remote_pack_provider(std::shared_ptr<distributor_client> client,
                                           std::string environment_id,
                                           remote_pack_refs packs)
    : client_{ std::move(client) },
      environment_id_{ std::move(environment_id) },
      packs_{ std::move(packs) } {
  if (!client_) { throw std::invalid_argument("remote_pack_provider: client is null"); }
}

std::filesystem::path remote_pack_provider::materialize(
    artifact_location const &location) const {
  return std::visit(
      match{
          [](artifact_file_path const &a) { return std::filesystem::path{ a.path }; },
          [](artifact_image_reference const &a) {
            return remote_pack_download_image(a.reference);
          },
          [](artifact_internal_handle const &a) {
            std::filesystem::path const path{ a.handle };
            std::error_code ec;
            if (std::filesystem::exists(path, ec)) { return path; }
            throw std::runtime_error(
                "unsupported distributor internal artifact handle (not a local path): " +
                a.handle);
          },
      },
      location);
}

std::optional<std::filesystem::path> remote_pack_provider::resolve(std::string_view tenant,
                                                                   pack_kind kind) {
  auto const ref_it{ packs_.find(kind) };
  if (ref_it == packs_.end()) { return std::nullopt; }

  std::string const cache_key{ std::string(tenant) + "::" + pack_kind_name(kind) };
  {
    std::lock_guard const lock{ cache_mutex_ };
    if (auto const it{ cache_.find(cache_key) }; it != cache_.end()) { return it->second; }
  }

  auto const &ref{ ref_it->second };
  auto const location{ client_->resolve({ .tenant = std::string(tenant),
                                          .environment_id = environment_id_,
                                          .pack_id = ref.pack_id,
                                          .component_id = ref.component_id,
                                          .version = ref.version }) };
  auto path{ materialize(location) };

  std::lock_guard const lock{ cache_mutex_ };
  auto const [it, inserted]{ cache_.emplace(cache_key, std::move(path)) };
  if (!inserted) {
    log::debug("pack cache: concurrent resolution of %s discarded", cache_key.c_str());
  }
  return it->second;
}

std::optional<gui_pack> remote_pack_provider::load_pack(std::string_view tenant,
                                                        pack_kind kind) {
  auto root{ resolve(tenant, kind) };
  if (!root) { return std::nullopt; }

  auto const manifest{ pack_manifest_load(*root) };
  auto pack{ gui_pack_from_manifest(manifest, kind, std::move(*root)) };
  if (!pack) {
    log::warn("pack for %s resolved for tenant %s declares a different kind; ignoring",
              pack_kind_name(kind),
              std::string(tenant).c_str());
  }
  return pack;
}

layout_pack remote_pack_provider::load_layout(std::string_view tenant) {
  auto pack{ load_pack(tenant, pack_kind::layout) };
  if (!pack) {
    throw std::runtime_error("no layout pack configured for tenant " + std::string(tenant));
  }
  return std::get<layout_pack>(std::move(*pack));
}

std::optional<auth_pack> remote_pack_provider::load_auth(std::string_view tenant) {
  auto pack{ load_pack(tenant, pack_kind::auth) };
  if (!pack) { return std::nullopt; }
  return std::get<auth_pack>(std::move(*pack));
}

std::optional<skin_pack> remote_pack_provider::load_skin(std::string_view tenant) {
  auto pack{ load_pack(tenant, pack_kind::skin) };
  if (!pack) { return std::nullopt; }
  return std::get<skin_pack>(std::move(*pack));
}

std::optional<telemetry_pack> remote_pack_provider::load_telemetry(std::string_view tenant) {
  auto pack{ load_pack(tenant, pack_kind::telemetry) };
  if (!pack) { return std::nullopt; }
  return std::get<telemetry_pack>(std::move(*pack));
}

std::vector<feature_pack> remote_pack_provider::load_features(std::string_view tenant) {
  std::vector<feature_pack> features;
  if (auto pack{ load_pack(tenant, pack_kind::feature) }) {
    features.push_back(std::get<feature_pack>(std::move(*pack)));
  }
  return features;
}

void remote_pack_provider::clear_cache() {
  {
    std::lock_guard const lock{ cache_mutex_ };
    cache_.clear();
  }
  log::info("pack cache cleared");
}

}  // namespace mosaic
