#pragma once

#include "picojson.h"

#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mosaic {

enum class pack_kind { layout, auth, feature, skin, telemetry };

// Manifest discriminator: "gui-layout", "gui-auth", ...
char const *pack_kind_name(pack_kind kind);

// Accepts discriminators ("gui-feature") and short operator aliases ("feature").
std::optional<pack_kind> pack_kind_parse(std::string_view name);

struct secret_scope {
  std::string env;
  std::string tenant;
  std::optional<std::string> team;
};

struct secret_requirement {
  std::string key;
  std::optional<secret_scope> scope;
  std::optional<std::string> description;
};

// "<env>/<tenant>/<team|_>::<key>", or "_/_/_::<key>" when unscoped.
std::string secret_requirement_key(secret_requirement const &req);

// Keeps the first requirement for each key, preserving order.
std::vector<secret_requirement> secret_requirements_dedup(
    std::vector<secret_requirement> requirements);

struct layout_manifest {
  std::vector<std::string> slots;
  std::string entrypoint_html;
  bool spa{ false };
  std::map<std::string, std::string> slot_selectors;
};

struct auth_route {
  std::string path;
  bool is_public{ false };
  std::string html;
};

struct auth_manifest {
  std::vector<auth_route> routes;
  picojson::value oauth;        // opaque, consumed by the OAuth collaborator
  picojson::value ui_bindings;  // opaque
};

struct feature_route {
  std::string path;
  bool authenticated{ false };
  std::string html;
};

struct worker_attach {
  std::string mode;
  std::string selector;
};

struct digital_worker {
  std::string id;
  std::string worker_id;
  worker_attach attach;
  std::vector<std::string> routes;
};

// Which module or file renders into which DOM location.
struct fragment_binding {
  std::string id;
  std::string selector;
  std::string component_world;
  std::string component_name;
};

struct feature_manifest {
  std::vector<feature_route> routes;
  std::vector<digital_worker> digital_workers;
  std::vector<fragment_binding> fragments;
};

struct layout_pack {
  layout_manifest manifest;
  std::filesystem::path root;
  std::vector<secret_requirement> secret_requirements;
};

struct auth_pack {
  auth_manifest manifest;
  std::filesystem::path root;
  std::vector<secret_requirement> secret_requirements;
};

struct feature_pack {
  feature_manifest manifest;
  std::filesystem::path root;
  std::vector<secret_requirement> secret_requirements;
};

struct skin_pack {
  picojson::value manifest;
  std::filesystem::path root;
  std::vector<secret_requirement> secret_requirements;
};

struct telemetry_pack {
  picojson::value manifest;
  std::filesystem::path root;
  std::vector<secret_requirement> secret_requirements;
};

using gui_pack = std::variant<layout_pack, auth_pack, feature_pack, skin_pack, telemetry_pack>;

pack_kind gui_pack_kind(gui_pack const &pack);
std::filesystem::path const &gui_pack_root(gui_pack const &pack);
std::vector<secret_requirement> const &gui_pack_secret_requirements(gui_pack const &pack);

// <root>/gui/assets
std::filesystem::path pack_assets_root(std::filesystem::path const &root);

// <root>/gui/manifest.json
std::filesystem::path pack_manifest_path(std::filesystem::path const &root);

// Manifest body does not match the schema of its declared kind.
class manifest_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Reads and parses <root>/gui/manifest.json. Throws std::runtime_error when the file
// cannot be read or is not valid JSON.
picojson::value pack_manifest_load(std::filesystem::path const &root);

// Value of the "kind" discriminator, if present and recognized.
std::optional<pack_kind> pack_manifest_kind(picojson::value const &manifest);

// Builds a typed pack when the manifest declares `expected`; nullopt when the declared
// kind differs or is unknown. Throws manifest_error when the body does not match the
// schema for its kind.
std::optional<gui_pack> gui_pack_from_manifest(picojson::value const &manifest,
                                               pack_kind expected,
                                               std::filesystem::path root);

}  // namespace mosaic
