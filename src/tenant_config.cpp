#include "tenant_config.h"

#include "log.h"
#include "routing.h"

#include "picojson.h"

#include <utility>

namespace mosaic {

namespace {

pack_location make_location(std::filesystem::path root,
                            std::vector<secret_requirement> secret_requirements) {
  auto assets{ pack_assets_root(root) };
  return { .root = std::move(root),
           .assets = std::move(assets),
           .secret_requirements = std::move(secret_requirements) };
}

void append_requirements(std::vector<secret_requirement> &out,
                         std::vector<secret_requirement> const &in) {
  out.insert(out.end(), in.begin(), in.end());
}

picojson::value string_array(std::vector<std::string> const &values) {
  picojson::array arr;
  arr.reserve(values.size());
  for (auto const &v : values) { arr.emplace_back(v); }
  return picojson::value(std::move(arr));
}

}  // namespace

tenant_gui_config tenant_gui_config::load(std::string_view tenant,
                                          std::string_view domain,
                                          pack_provider &provider) {
  tenant_gui_config cfg{ .tenant = std::string(tenant), .domain = std::string(domain) };

  auto layout{ provider.load_layout(tenant) };
  cfg.layout = { .manifest = std::move(layout.manifest),
                 .location = make_location(std::move(layout.root),
                                           std::move(layout.secret_requirements)) };

  if (auto auth{ provider.load_auth(tenant) }) {
    cfg.auth = tenant_auth{ .manifest = std::move(auth->manifest),
                            .location = make_location(std::move(auth->root),
                                                      std::move(auth->secret_requirements)) };
  }

  if (auto skin{ provider.load_skin(tenant) }) {
    cfg.skin = make_location(std::move(skin->root), std::move(skin->secret_requirements));
  }

  if (auto telemetry{ provider.load_telemetry(tenant) }) {
    cfg.telemetry =
        make_location(std::move(telemetry->root), std::move(telemetry->secret_requirements));
  }

  for (auto &feature : provider.load_features(tenant)) {
    cfg.features.push_back(
        { .manifest = std::move(feature.manifest),
          .location = make_location(std::move(feature.root),
                                    std::move(feature.secret_requirements)) });
  }

  std::vector<secret_requirement> requirements;
  append_requirements(requirements, cfg.layout.location.secret_requirements);
  if (cfg.auth) { append_requirements(requirements, cfg.auth->location.secret_requirements); }
  if (cfg.skin) { append_requirements(requirements, cfg.skin->secret_requirements); }
  if (cfg.telemetry) { append_requirements(requirements, cfg.telemetry->secret_requirements); }
  for (auto const &feature : cfg.features) {
    append_requirements(requirements, feature.location.secret_requirements);
  }
  cfg.secret_requirements = secret_requirements_dedup(std::move(requirements));

  log::debug("tenant %s: %zu feature pack(s), auth %s, %zu secret requirement(s)",
             cfg.tenant.c_str(),
             cfg.features.size(),
             cfg.auth ? "present" : "absent",
             cfg.secret_requirements.size());
  return cfg;
}

resolved_route tenant_gui_config::resolve_route(std::string_view raw_path) const {
  std::string const path{ normalize_route(raw_path) };

  for (auto const &feature : features) {
    for (auto const &route : feature.manifest.routes) {
      if (!route_path_matches(path, route.path)) { continue; }

      resolved_route resolved{ .origin = route_origin::feature,
                               .document = feature.location.assets / route.html,
                               .authenticated = route.authenticated };
      resolved.fragments.reserve(feature.manifest.fragments.size());
      for (auto const &binding : feature.manifest.fragments) {
        resolved.fragments.push_back({ .binding = binding,
                                       .assets_root = feature.location.assets });
      }
      return resolved;
    }
  }

  if (auth) {
    for (auto const &route : auth->manifest.routes) {
      if (route_path_matches(path, route.path)) {
        return { .origin = route_origin::auth,
                 .document = auth->location.assets / route.html,
                 .authenticated = !route.is_public };
      }
    }
  }

  return { .origin = route_origin::layout,
           .document = layout.location.assets / layout.manifest.entrypoint_html,
           .authenticated = false };
}

std::string tenant_gui_config_summary(tenant_gui_config const &cfg) {
  picojson::array routes;
  picojson::array workers;

  for (auto const &feature : cfg.features) {
    for (auto const &route : feature.manifest.routes) {
      picojson::object r;
      r["path"] = picojson::value(route.path);
      r["authenticated"] = picojson::value(route.authenticated);
      routes.emplace_back(std::move(r));
    }

    for (auto const &worker : feature.manifest.digital_workers) {
      picojson::object attach;
      attach["mode"] = picojson::value(worker.attach.mode);
      attach["selector"] = picojson::value(worker.attach.selector);

      picojson::object w;
      w["id"] = picojson::value(worker.id);
      w["worker_id"] = picojson::value(worker.worker_id);
      w["attach"] = picojson::value(std::move(attach));
      w["routes"] = string_array(worker.routes);
      workers.emplace_back(std::move(w));
    }
  }

  picojson::object summary;
  summary["tenant"] = picojson::value(cfg.tenant);
  summary["domain"] = picojson::value(cfg.domain);
  summary["routes"] = picojson::value(std::move(routes));
  summary["workers"] = picojson::value(std::move(workers));
  summary["skin"] = cfg.skin ? picojson::value(cfg.skin->assets.string()) : picojson::value();
  return picojson::value(std::move(summary)).serialize();
}

}  // namespace mosaic
