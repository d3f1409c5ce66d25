#include "distributor_client.h"

#include "json_util.h"

#include "picojson.h"

#include <stdexcept>
#include <utility>

namespace mosaic {

namespace {

constexpr std::string_view kResolvePath{ "/distributor-api/resolve-component" };

}  // namespace

artifact_location artifact_location_from_json(std::string_view text) {
  constexpr std::string_view ctx{ "distributor response" };

  auto const root{ json_parse(text, ctx) };
  auto const artifact{ json_get_required<picojson::object>(json_as_object(root, ctx),
                                                           "artifact",
                                                           ctx) };
  auto const kind{ json_get_required<std::string>(artifact, "kind", ctx) };

  if (kind == "file_path") {
    return artifact_file_path{ json_get_required<std::string>(artifact, "path", ctx) };
  }
  if (kind == "oci_reference") {
    return artifact_image_reference{
      json_get_required<std::string>(artifact, "reference", ctx)
    };
  }
  if (kind == "distributor_internal") {
    return artifact_internal_handle{ json_get_required<std::string>(artifact, "handle", ctx) };
  }
  throw std::runtime_error("distributor response: unknown artifact kind '" + kind + "'");
}

std::string resolve_component_request_to_json(resolve_component_request const &request) {
  picojson::object obj;
  obj["tenant"] = picojson::value(request.tenant);
  obj["environment_id"] = picojson::value(request.environment_id);
  obj["pack_id"] = picojson::value(request.pack_id);
  obj["component_id"] = picojson::value(request.component_id);
  obj["version"] = picojson::value(request.version);
  return picojson::value(obj).serialize();
}

http_distributor_client::http_distributor_client(std::string base_url, std::string auth_token)
    : auth_{ .bearer_token = std::move(auth_token) } {
  while (base_url.ends_with('/')) { base_url.pop_back(); }
  endpoint_ = base_url + std::string(kResolvePath);
}

artifact_location http_distributor_client::resolve(resolve_component_request const &request) {
  auto const response{
    libcurl_post_json(endpoint_, resolve_component_request_to_json(request), auth_)
  };
  if (response.status < 200 || response.status > 299) {
    throw std::runtime_error("distributor resolve of " + request.pack_id + "/" +
                             request.component_id + "@" + request.version +
                             " failed: status " + std::to_string(response.status));
  }
  return artifact_location_from_json(response.body);
}

}  // namespace mosaic
