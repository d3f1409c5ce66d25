#include "routing.h"

#include "fs_pack_provider.h"
#include "test_support.h"
#include "util.h"

#include "doctest.h"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <variant>

TEST_CASE("normalize_route") {
  CHECK(mosaic::normalize_route("invoices") == "/invoices");
  CHECK(mosaic::normalize_route("  /invoices  ") == "/invoices");
  CHECK(mosaic::normalize_route("//a///b//") == "/a/b/");
  CHECK(mosaic::normalize_route("") == "/");
  CHECK(mosaic::normalize_route("   ") == "/");

  SUBCASE("idempotent") {
    for (auto const *raw : { "", "a", "//a//b", " /x/ ", "/docs/*", "a/b/c/" }) {
      auto const once{ mosaic::normalize_route(raw) };
      CHECK(mosaic::normalize_route(once) == once);
      CHECK(once.starts_with("/"));
      CHECK(once.find("//") == std::string::npos);
    }
  }
}

TEST_CASE("route_path_matches wildcard prefixes") {
  CHECK(mosaic::route_path_matches("/docs", "/docs/*"));
  CHECK(mosaic::route_path_matches("/docs/", "/docs/*"));
  CHECK(mosaic::route_path_matches("/docs/api", "/docs/*"));
  CHECK(mosaic::route_path_matches("/docs/api/v2", "/docs/*"));
  CHECK_FALSE(mosaic::route_path_matches("/documentation", "/docs/*"));
  CHECK_FALSE(mosaic::route_path_matches("/doc", "/docs/*"));

  CHECK(mosaic::route_path_matches("/", "/*"));
  CHECK(mosaic::route_path_matches("/anything/at/all", "/*"));
}

TEST_CASE("route_path_matches exact patterns") {
  CHECK(mosaic::route_path_matches("/invoices", "/invoices"));
  CHECK(mosaic::route_path_matches("/invoices", "invoices"));
  CHECK(mosaic::route_path_matches("/invoices", "//invoices"));
  CHECK_FALSE(mosaic::route_path_matches("/invoices/1", "/invoices"));
  CHECK_FALSE(mosaic::route_path_matches("/invoice", "/invoices"));
}

namespace {

struct acme_site {
  std::filesystem::path root{ mosaic::util_make_temp_dir("mosaic-routing-test-") };
  mosaic::scoped_path_cleanup cleanup{ root };
  mosaic::trusting_session_manager sessions{ "acme", "user-1" };

  mosaic::tenant_gui_config load(bool with_auth) {
    mosaic::test::write_acme_tenant(root, with_auth);
    mosaic::fs_pack_provider provider{ root };
    return mosaic::tenant_gui_config::load("acme", "acme.example.com", provider);
  }
};

}  // namespace

TEST_CASE_FIXTURE(acme_site, "decide_route redirects to the first auth route") {
  auto const cfg{ load(true) };
  auto const decision{ mosaic::decide_route(cfg, "/invoices", std::nullopt, sessions) };

  auto const *redirect{ std::get_if<mosaic::route_redirect>(&decision) };
  REQUIRE(redirect != nullptr);
  CHECK(redirect->location == "/signin");
}

TEST_CASE_FIXTURE(acme_site, "decide_route redirects to /login without an auth pack") {
  auto const cfg{ load(false) };
  CHECK(mosaic::login_target(cfg) == "/login");

  auto const decision{ mosaic::decide_route(cfg, "/invoices", std::string{}, sessions) };
  auto const *redirect{ std::get_if<mosaic::route_redirect>(&decision) };
  REQUIRE(redirect != nullptr);
  CHECK(redirect->location == "/login");
}

TEST_CASE_FIXTURE(acme_site, "decide_route serves the feature document with a session") {
  auto const cfg{ load(false) };
  auto const decision{ mosaic::decide_route(cfg, "/invoices", "token-123", sessions) };

  auto const *serve{ std::get_if<mosaic::route_serve>(&decision) };
  REQUIRE(serve != nullptr);
  CHECK(serve->html.find("<div id=\"summary\">loading</div>") != std::string::npos);
  REQUIRE(serve->fragments.size() == 1);
  CHECK(serve->fragments[0].binding.selector == "#summary");
  REQUIRE(serve->session.has_value());
  CHECK(serve->session->session_id == "token-123");
  CHECK(serve->session->user_id == "user-1");
}

TEST_CASE_FIXTURE(acme_site, "decide_route serves public documents without a session") {
  auto const cfg{ load(true) };

  auto const signin{ mosaic::decide_route(cfg, "/signin", std::nullopt, sessions) };
  REQUIRE(std::holds_alternative<mosaic::route_serve>(signin));
  CHECK(std::get<mosaic::route_serve>(signin).html.find("sign in") != std::string::npos);
  CHECK_FALSE(std::get<mosaic::route_serve>(signin).session.has_value());

  auto const home{ mosaic::decide_route(cfg, "/", std::nullopt, sessions) };
  REQUIRE(std::holds_alternative<mosaic::route_serve>(home));
  CHECK(std::get<mosaic::route_serve>(home).html.find("home") != std::string::npos);
}

TEST_CASE_FIXTURE(acme_site, "decide_route throws when the document is missing") {
  auto const cfg{ load(true) };
  // profile.html is declared by the auth pack but never written.
  CHECK_THROWS_AS(mosaic::decide_route(cfg, "/profile", "token", sessions),
                  std::runtime_error);
}
