#include "pack.h"

#include "json_util.h"
#include "util.h"

#include <unordered_set>
#include <utility>

namespace mosaic {

namespace {

struct kind_alias {
  std::string_view name;
  pack_kind kind;
};

constexpr kind_alias kKindAliases[]{
  { "gui-layout", pack_kind::layout },
  { "gui-auth", pack_kind::auth },
  { "gui-feature", pack_kind::feature },
  { "gui-skin", pack_kind::skin },
  { "gui-telemetry", pack_kind::telemetry },
  { "layout", pack_kind::layout },
  { "auth", pack_kind::auth },
  { "feature", pack_kind::feature },
  { "skin", pack_kind::skin },
  { "telemetry", pack_kind::telemetry },
};

std::vector<std::string> parse_string_array(picojson::array const &values,
                                            std::string const &context) {
  std::vector<std::string> result;
  result.reserve(values.size());
  for (auto const &value : values) {
    if (!value.is<std::string>()) {
      throw std::runtime_error(context + ": array entries must be strings");
    }
    result.push_back(value.get<std::string>());
  }
  return result;
}

template <typename T, typename Fn>
std::vector<T> parse_object_array(picojson::object const &obj,
                                  std::string_view key,
                                  bool required,
                                  std::string const &context,
                                  Fn &&parse_entry) {
  auto const values{ required
                         ? std::optional{ json_get_required<picojson::array>(obj, key, context) }
                         : json_get_optional<picojson::array>(obj, key, context) };
  std::vector<T> result;
  if (!values) { return result; }

  result.reserve(values->size());
  for (std::size_t i{ 0 }; i < values->size(); ++i) {
    std::string const entry_ctx{ context + "." + std::string(key) + "[" + std::to_string(i) +
                                 "]" };
    result.push_back(parse_entry(json_as_object((*values)[i], entry_ctx), entry_ctx));
  }
  return result;
}

std::vector<secret_requirement> parse_secret_requirements(picojson::object const &obj,
                                                          std::string const &context) {
  return parse_object_array<secret_requirement>(
      obj,
      "secret_requirements",
      false,
      context,
      [](picojson::object const &entry, std::string const &ctx) {
        secret_requirement req{ .key = json_get_required<std::string>(entry, "key", ctx) };
        if (auto const scope{ json_get_optional<picojson::object>(entry, "scope", ctx) }) {
          std::string const scope_ctx{ ctx + ".scope" };
          req.scope = secret_scope{
            .env = json_get_required<std::string>(*scope, "env", scope_ctx),
            .tenant = json_get_required<std::string>(*scope, "tenant", scope_ctx),
            .team = json_get_optional<std::string>(*scope, "team", scope_ctx),
          };
        }
        req.description = json_get_optional<std::string>(entry, "description", ctx);
        return req;
      });
}

layout_manifest parse_layout_manifest(picojson::object const &obj, std::string const &ctx) {
  std::string const layout_ctx{ ctx + ".layout" };
  auto const layout{ json_get_required<picojson::object>(obj, "layout", ctx) };

  layout_manifest result{
    .entrypoint_html = json_get_required<std::string>(layout, "entrypoint_html", layout_ctx),
    .spa = json_get_or_default<bool>(layout, "spa", false, layout_ctx),
  };

  if (auto const slots{ json_get_optional<picojson::array>(layout, "slots", layout_ctx) }) {
    result.slots = parse_string_array(*slots, layout_ctx + ".slots");
  }

  if (auto const selectors{
          json_get_optional<picojson::object>(layout, "slot_selectors", layout_ctx) }) {
    for (auto const &[slot, selector] : *selectors) {
      if (!selector.is<std::string>()) {
        throw std::runtime_error(layout_ctx + ".slot_selectors: " + slot +
                                 " must be a string");
      }
      result.slot_selectors.emplace(slot, selector.get<std::string>());
    }
  }

  return result;
}

auth_manifest parse_auth_manifest(picojson::object const &obj, std::string const &ctx) {
  auth_manifest result{
    .routes = parse_object_array<auth_route>(
        obj,
        "routes",
        true,
        ctx,
        [](picojson::object const &entry, std::string const &entry_ctx) {
          return auth_route{
            .path = json_get_required<std::string>(entry, "path", entry_ctx),
            .is_public = json_get_or_default<bool>(entry, "public", false, entry_ctx),
            .html = json_get_required<std::string>(entry, "html", entry_ctx),
          };
        }),
  };

  if (auto const it{ obj.find("oauth") }; it != obj.end()) { result.oauth = it->second; }
  if (auto const it{ obj.find("ui_bindings") }; it != obj.end()) {
    result.ui_bindings = it->second;
  }
  return result;
}

feature_manifest parse_feature_manifest(picojson::object const &obj, std::string const &ctx) {
  feature_manifest result;

  result.routes = parse_object_array<feature_route>(
      obj,
      "routes",
      true,
      ctx,
      [](picojson::object const &entry, std::string const &entry_ctx) {
        return feature_route{
          .path = json_get_required<std::string>(entry, "path", entry_ctx),
          .authenticated =
              json_get_or_default<bool>(entry, "authenticated", false, entry_ctx),
          .html = json_get_required<std::string>(entry, "html", entry_ctx),
        };
      });

  result.digital_workers = parse_object_array<digital_worker>(
      obj,
      "digital_workers",
      false,
      ctx,
      [](picojson::object const &entry, std::string const &entry_ctx) {
        std::string const attach_ctx{ entry_ctx + ".attach" };
        auto const attach{ json_get_required<picojson::object>(entry, "attach", entry_ctx) };
        digital_worker worker{
          .id = json_get_required<std::string>(entry, "id", entry_ctx),
          .worker_id = json_get_required<std::string>(entry, "worker_id", entry_ctx),
          .attach = { .mode = json_get_required<std::string>(attach, "mode", attach_ctx),
                      .selector =
                          json_get_required<std::string>(attach, "selector", attach_ctx) },
        };
        if (auto const routes{
                json_get_optional<picojson::array>(entry, "routes", entry_ctx) }) {
          worker.routes = parse_string_array(*routes, entry_ctx + ".routes");
        }
        return worker;
      });

  result.fragments = parse_object_array<fragment_binding>(
      obj,
      "fragments",
      false,
      ctx,
      [](picojson::object const &entry, std::string const &entry_ctx) {
        return fragment_binding{
          .id = json_get_required<std::string>(entry, "id", entry_ctx),
          .selector = json_get_required<std::string>(entry, "selector", entry_ctx),
          .component_world =
              json_get_required<std::string>(entry, "component_world", entry_ctx),
          .component_name =
              json_get_required<std::string>(entry, "component_name", entry_ctx),
        };
      });

  return result;
}

}  // namespace

char const *pack_kind_name(pack_kind kind) {
  switch (kind) {
    case pack_kind::layout: return "gui-layout";
    case pack_kind::auth: return "gui-auth";
    case pack_kind::feature: return "gui-feature";
    case pack_kind::skin: return "gui-skin";
    case pack_kind::telemetry: return "gui-telemetry";
  }
  return "unknown";
}

std::optional<pack_kind> pack_kind_parse(std::string_view name) {
  for (auto const &alias : kKindAliases) {
    if (alias.name == name) { return alias.kind; }
  }
  return std::nullopt;
}

std::string secret_requirement_key(secret_requirement const &req) {
  if (!req.scope) { return "_/_/_::" + req.key; }
  return req.scope->env + "/" + req.scope->tenant + "/" + req.scope->team.value_or("_") +
         "::" + req.key;
}

std::vector<secret_requirement> secret_requirements_dedup(
    std::vector<secret_requirement> requirements) {
  std::unordered_set<std::string> seen;
  std::vector<secret_requirement> result;
  result.reserve(requirements.size());
  for (auto &req : requirements) {
    if (seen.insert(secret_requirement_key(req)).second) { result.push_back(std::move(req)); }
  }
  return result;
}

pack_kind gui_pack_kind(gui_pack const &pack) {
  return std::visit(
      match{
          [](layout_pack const &) { return pack_kind::layout; },
          [](auth_pack const &) { return pack_kind::auth; },
          [](feature_pack const &) { return pack_kind::feature; },
          [](skin_pack const &) { return pack_kind::skin; },
          [](telemetry_pack const &) { return pack_kind::telemetry; },
      },
      pack);
}

std::filesystem::path const &gui_pack_root(gui_pack const &pack) {
  return std::visit([](auto const &p) -> std::filesystem::path const & { return p.root; },
                    pack);
}

std::vector<secret_requirement> const &gui_pack_secret_requirements(gui_pack const &pack) {
  return std::visit(
      [](auto const &p) -> std::vector<secret_requirement> const & {
        return p.secret_requirements;
      },
      pack);
}

std::filesystem::path pack_assets_root(std::filesystem::path const &root) {
  return root / "gui" / "assets";
}

std::filesystem::path pack_manifest_path(std::filesystem::path const &root) {
  return root / "gui" / "manifest.json";
}

picojson::value pack_manifest_load(std::filesystem::path const &root) {
  auto const path{ pack_manifest_path(root) };
  auto const text{ util_load_text_file(path) };
  return json_parse(text, path.string());
}

std::optional<pack_kind> pack_manifest_kind(picojson::value const &manifest) {
  if (!manifest.is<picojson::object>()) { return std::nullopt; }
  auto const &obj{ manifest.get<picojson::object>() };
  auto const it{ obj.find("kind") };
  if (it == obj.end() || !it->second.is<std::string>()) { return std::nullopt; }

  auto const &name{ it->second.get<std::string>() };
  if (!name.starts_with("gui-")) { return std::nullopt; }
  return pack_kind_parse(name);
}

std::optional<gui_pack> gui_pack_from_manifest(picojson::value const &manifest,
                                               pack_kind expected,
                                               std::filesystem::path root) {
  auto const declared{ pack_manifest_kind(manifest) };
  if (!declared || *declared != expected) { return std::nullopt; }

  std::string const ctx{ pack_manifest_path(root).string() };
  try {
    auto const &obj{ json_as_object(manifest, ctx) };
    auto secrets{ parse_secret_requirements(obj, ctx) };

    switch (expected) {
      case pack_kind::layout:
        return layout_pack{ .manifest = parse_layout_manifest(obj, ctx),
                            .root = std::move(root),
                            .secret_requirements = std::move(secrets) };
      case pack_kind::auth:
        return auth_pack{ .manifest = parse_auth_manifest(obj, ctx),
                          .root = std::move(root),
                          .secret_requirements = std::move(secrets) };
      case pack_kind::feature:
        return feature_pack{ .manifest = parse_feature_manifest(obj, ctx),
                             .root = std::move(root),
                             .secret_requirements = std::move(secrets) };
      case pack_kind::skin:
        return skin_pack{ .manifest = manifest,
                          .root = std::move(root),
                          .secret_requirements = std::move(secrets) };
      case pack_kind::telemetry:
        return telemetry_pack{ .manifest = manifest,
                               .root = std::move(root),
                               .secret_requirements = std::move(secrets) };
    }
  } catch (manifest_error const &) {
    throw;
  } catch (std::runtime_error const &e) {
    throw manifest_error(e.what());
  }
  return std::nullopt;
}

}  // namespace mosaic
