#include "cmd_version.h"

#include "log.h"

#include "CLI11.hpp"
#include "archive.h"
#include "sol/sol.hpp"
#include "tbb/version.h"

#include <curl/curl.h>
#include <libxml/xmlversion.h>

#include <string>
#include <vector>

#ifndef MOSAIC_VERSION_STR
#error "MOSAIC_VERSION_STR must be defined by the build system"
#endif

namespace mosaic {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_version::cmd_version(cmd_version::cfg cfg, app_config const & /*app*/)
    : cfg_{ std::move(cfg) } {}

void cmd_version::execute() {
  log::info("mosaic version %s", MOSAIC_VERSION_STR);
  log::info("");
  log::info("Third-party component versions:");

  curl_version_info_data const *curl_info{ curl_version_info(CURLVERSION_NOW) };
  std::vector<std::string> curl_features;
  if (curl_info->features & CURL_VERSION_SSL) { curl_features.push_back("ssl"); }
  if (curl_info->features & CURL_VERSION_LIBZ) { curl_features.push_back("zlib"); }
  if (!curl_features.empty()) {
    std::string features;
    for (size_t i{ 0 }; i < curl_features.size(); ++i) {
      if (i > 0) features.append(", ");
      features.append(curl_features[i]);
    }
    log::info("  libcurl: %s (%s)", curl_info->version, features.c_str());
  } else {
    log::info("  libcurl: %s", curl_info->version);
  }

  log::info("  libarchive: %s", archive_version_details());
  log::info("  libxml2: %s", LIBXML_DOTTED_VERSION);
  log::info("  Lua: %s", LUA_RELEASE);
  log::info("  Sol2: %s", SOL_VERSION_STRING);
  log::info("  oneTBB: %s (runtime %s)", TBB_VERSION_STRING, TBB_runtime_version());
  log::info("  CLI11: %s", CLI11_VERSION);
}

}  // namespace mosaic
