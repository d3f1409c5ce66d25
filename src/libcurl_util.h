#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace mosaic {

struct libcurl_auth {
  std::string bearer_token;  // wins over basic credentials when set
  std::string username;
  std::string password;
};

struct libcurl_response {
  long status{ 0 };
  std::string body;
};

void libcurl_ensure_initialized();

// GET url into destination (parent directories created). A non-2xx HTTP status is an
// error; the partial file is removed on failure.
std::filesystem::path libcurl_download(std::string_view url,
                                       std::filesystem::path const &destination,
                                       libcurl_auth const &auth = {});

// POST a JSON body and return the response. Transport failures throw; HTTP status is
// returned for the caller to judge.
libcurl_response libcurl_post_json(std::string_view url,
                                   std::string_view body,
                                   libcurl_auth const &auth = {});

}  // namespace mosaic
