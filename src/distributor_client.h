#pragma once

#include "libcurl_util.h"

#include <string>
#include <string_view>
#include <variant>

namespace mosaic {

struct resolve_component_request {
  std::string tenant;
  std::string environment_id;
  std::string pack_id;
  std::string component_id;
  std::string version;
};

// Where a resolved pack artifact lives.
struct artifact_file_path {
  std::string path;
};

struct artifact_image_reference {
  std::string reference;  // downloadable URL of a tar or tar.gz artifact
};

struct artifact_internal_handle {
  std::string handle;
};

using artifact_location =
    std::variant<artifact_file_path, artifact_image_reference, artifact_internal_handle>;

class distributor_client {
 public:
  virtual ~distributor_client() = default;
  virtual artifact_location resolve(resolve_component_request const &request) = 0;
};

// Parses {"artifact": {"kind": "file_path"|"oci_reference"|"distributor_internal", ...}}.
artifact_location artifact_location_from_json(std::string_view text);

std::string resolve_component_request_to_json(resolve_component_request const &request);

// POSTs the request to <base_url>/distributor-api/resolve-component.
class http_distributor_client : public distributor_client {
 public:
  http_distributor_client(std::string base_url, std::string auth_token);

  artifact_location resolve(resolve_component_request const &request) override;

 private:
  std::string endpoint_;
  libcurl_auth auth_;
};

}  // namespace mosaic
