#include "libcurl_util.h"

#include <curl/curl.h>

#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace mosaic {

namespace {

constexpr char kDefaultUserAgent[]{ "mosaic/0.1" };

using curl_handle_t = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using curl_headers_t = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

size_t curl_write_file(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *stream{ static_cast<std::ofstream *>(userdata) };
  size_t const total{ size * nmemb };
  stream->write(ptr, static_cast<std::streamsize>(total));
  if (!*stream) { return 0; }
  return total;
}

size_t curl_write_string(char *ptr, size_t size, size_t nmemb, void *userdata) {
  size_t const total{ size * nmemb };
  static_cast<std::string *>(userdata)->append(ptr, total);
  return total;
}

curl_handle_t make_handle() {
  libcurl_ensure_initialized();
  curl_handle_t handle{ curl_easy_init(), &curl_easy_cleanup };
  if (!handle) { throw std::runtime_error("curl_easy_init failed"); }
  return handle;
}

auto make_setopt(CURL *handle) {
  return [handle](auto option, auto value) {
    CURLcode const rc{ curl_easy_setopt(handle, option, value) };
    if (rc != CURLE_OK) {
      throw std::runtime_error(std::string("curl_easy_setopt failed: ") +
                               curl_easy_strerror(rc));
    }
  };
}

// Applies auth and returns the header list, which must outlive the transfer.
curl_headers_t apply_auth(CURL *handle, libcurl_auth const &auth, curl_headers_t headers) {
  auto const setopt{ make_setopt(handle) };

  if (!auth.bearer_token.empty()) {
    std::string const header{ "Authorization: Bearer " + auth.bearer_token };
    curl_slist *appended{ curl_slist_append(headers.get(), header.c_str()) };
    if (!appended) { throw std::runtime_error("curl_slist_append failed"); }
    static_cast<void>(headers.release());
    headers.reset(appended);
  } else if (!auth.username.empty() || !auth.password.empty()) {
    setopt(CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
    setopt(CURLOPT_USERNAME, auth.username.c_str());
    setopt(CURLOPT_PASSWORD, auth.password.c_str());
  }

  if (headers) { setopt(CURLOPT_HTTPHEADER, headers.get()); }
  return headers;
}

long response_code(CURL *handle) {
  long code{ 0 };
  curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &code);
  return code;
}

}  // namespace

void libcurl_ensure_initialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    CURLcode const code{ curl_global_init(CURL_GLOBAL_DEFAULT) };
    if (code != CURLE_OK) {
      throw std::runtime_error(std::string("curl_global_init failed: ") +
                               curl_easy_strerror(code));
    }
  });
}

std::filesystem::path libcurl_download(std::string_view url,
                                       std::filesystem::path const &destination,
                                       libcurl_auth const &auth) {
  std::string const url_copy{ url };

  if (destination.empty()) {
    throw std::invalid_argument("libcurl_download: destination is empty");
  }

  std::filesystem::path resolved_destination{ destination };
  if (!resolved_destination.is_absolute()) {
    resolved_destination = std::filesystem::absolute(resolved_destination);
  }
  resolved_destination = resolved_destination.lexically_normal();

  std::error_code ec;
  auto const parent{ resolved_destination.parent_path() };
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw std::runtime_error("libcurl_download: failed to create parent directory: " +
                               parent.string() + ": " + ec.message());
    }
  }

  auto handle{ make_handle() };
  auto const setopt{ make_setopt(handle.get()) };

  std::ofstream output{ resolved_destination, std::ios::binary | std::ios::trunc };
  if (!output.is_open()) {
    throw std::runtime_error("libcurl_download: failed to open destination: " +
                             resolved_destination.string());
  }

  setopt(CURLOPT_URL, url_copy.c_str());
  setopt(CURLOPT_FOLLOWLOCATION, 1L);
  setopt(CURLOPT_NOSIGNAL, 1L);
  setopt(CURLOPT_USERAGENT, kDefaultUserAgent);
  setopt(CURLOPT_WRITEFUNCTION, curl_write_file);
  setopt(CURLOPT_WRITEDATA, &output);
  setopt(CURLOPT_NOPROGRESS, 1L);
  auto const headers{ apply_auth(handle.get(), auth, { nullptr, &curl_slist_free_all }) };

  auto const fail{ [&](std::string const &message) {
    output.close();
    std::filesystem::remove(resolved_destination, ec);
    throw std::runtime_error(message);
  } };

  CURLcode const perform_result{ curl_easy_perform(handle.get()) };
  if (perform_result != CURLE_OK) {
    fail(std::string("curl_easy_perform failed for ") + url_copy + ": " +
         curl_easy_strerror(perform_result));
  }

  // 0 for non-HTTP schemes such as file://
  if (long const status{ response_code(handle.get()) };
      status != 0 && (status < 200 || status > 299)) {
    fail("libcurl_download: " + url_copy + ": status " + std::to_string(status));
  }

  output.flush();
  if (!output) { fail("libcurl_download: failed to flush destination file"); }
  output.close();

  return resolved_destination;
}

libcurl_response libcurl_post_json(std::string_view url,
                                   std::string_view body,
                                   libcurl_auth const &auth) {
  std::string const url_copy{ url };
  std::string const body_copy{ body };

  auto handle{ make_handle() };
  auto const setopt{ make_setopt(handle.get()) };

  curl_headers_t headers{ curl_slist_append(nullptr, "Content-Type: application/json"),
                          &curl_slist_free_all };
  if (!headers) { throw std::runtime_error("curl_slist_append failed"); }

  libcurl_response response;

  setopt(CURLOPT_URL, url_copy.c_str());
  setopt(CURLOPT_NOSIGNAL, 1L);
  setopt(CURLOPT_USERAGENT, kDefaultUserAgent);
  setopt(CURLOPT_POST, 1L);
  setopt(CURLOPT_POSTFIELDS, body_copy.c_str());
  setopt(CURLOPT_POSTFIELDSIZE, static_cast<long>(body_copy.size()));
  setopt(CURLOPT_WRITEFUNCTION, curl_write_string);
  setopt(CURLOPT_WRITEDATA, &response.body);
  setopt(CURLOPT_NOPROGRESS, 1L);
  headers = apply_auth(handle.get(), auth, std::move(headers));

  CURLcode const perform_result{ curl_easy_perform(handle.get()) };
  if (perform_result != CURLE_OK) {
    throw std::runtime_error(std::string("curl_easy_perform failed for ") + url_copy + ": " +
                             curl_easy_strerror(perform_result));
  }

  response.status = response_code(handle.get());
  return response;
}

}  // namespace mosaic
