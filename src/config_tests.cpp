#include "config.h"

#include "fs_pack_provider.h"
#include "remote_pack_provider.h"

#include "doctest.h"

#include <chrono>
#include <stdexcept>

TEST_CASE("app_config tenant_for_domain falls back to the default tenant") {
  mosaic::app_config config;
  config.tenant_map = { { "acme.example.com", "acme" }, { "globex.test", "globex" } };

  CHECK(config.tenant_for_domain("acme.example.com") == "acme");
  CHECK(config.tenant_for_domain("globex.test") == "globex");
  CHECK(config.tenant_for_domain("unknown.test") == "tenant-default");
  CHECK(config.tenant_for_domain("") == "tenant-default");

  config.default_tenant = "fallback";
  CHECK(config.tenant_for_domain("unknown.test") == "fallback");
}

TEST_CASE("app_config effective_tenant prefers the explicit tenant") {
  mosaic::app_config config;
  config.tenant_map = { { "acme.example.com", "acme" } };
  config.domain = "acme.example.com";
  CHECK(config.effective_tenant() == "acme");

  config.tenant = "override";
  CHECK(config.effective_tenant() == "override");

  config.tenant.reset();
  config.domain = "elsewhere.test";
  CHECK(config.effective_tenant() == "tenant-default");
}

TEST_CASE("app_config_parse_tenant_map") {
  SUBCASE("empty text yields an empty map") {
    CHECK(mosaic::app_config_parse_tenant_map("").empty());
    CHECK(mosaic::app_config_parse_tenant_map("  \n").empty());
  }

  SUBCASE("object of strings") {
    auto const map{ mosaic::app_config_parse_tenant_map(
        R"({"a.test": "alpha", "b.test": "beta"})") };
    REQUIRE(map.size() == 2);
    CHECK(map.at("a.test") == "alpha");
    CHECK(map.at("b.test") == "beta");
  }

  SUBCASE("non-string value") {
    CHECK_THROWS_WITH_AS(mosaic::app_config_parse_tenant_map(R"({"a.test": 3})"),
                         "tenant map: value for 'a.test' must be a string",
                         std::runtime_error);
  }

  SUBCASE("not an object") {
    CHECK_THROWS_AS(mosaic::app_config_parse_tenant_map(R"(["a.test"])"), std::runtime_error);
  }

  SUBCASE("malformed json") {
    CHECK_THROWS_AS(mosaic::app_config_parse_tenant_map("{"), std::runtime_error);
  }
}

TEST_CASE("app_config make_sandbox_limits") {
  mosaic::app_config config;

  SUBCASE("defaults") {
    auto const limits{ config.make_sandbox_limits() };
    CHECK(limits.deadline == std::chrono::milliseconds{ 250 });
    CHECK(limits.memory_bytes == 16u * 1024u * 1024u);
  }

  SUBCASE("overrides") {
    config.fragment_timeout_ms = 40;
    config.fragment_memory_mb = 2;
    auto const limits{ config.make_sandbox_limits() };
    CHECK(limits.deadline == std::chrono::milliseconds{ 40 });
    CHECK(limits.memory_bytes == 2u * 1024u * 1024u);
  }

  SUBCASE("zero timeout") {
    config.fragment_timeout_ms = 0;
    CHECK_THROWS_AS(config.make_sandbox_limits(), std::invalid_argument);
  }

  SUBCASE("zero memory") {
    config.fragment_memory_mb = 0;
    CHECK_THROWS_AS(config.make_sandbox_limits(), std::invalid_argument);
  }
}

TEST_CASE("app_config make_pack_provider") {
  mosaic::app_config config;
  config.pack_root = "/srv/packs";

  SUBCASE("filesystem by default") {
    auto const provider{ config.make_pack_provider() };
    auto const *fs{ dynamic_cast<mosaic::fs_pack_provider *>(provider.get()) };
    REQUIRE(fs != nullptr);
    CHECK(fs->pack_root() == "/srv/packs");
  }

  SUBCASE("filesystem when only the url is set") {
    config.distributor.url = "https://distributor.test";
    auto const provider{ config.make_pack_provider() };
    CHECK(dynamic_cast<mosaic::fs_pack_provider *>(provider.get()) != nullptr);
  }

  SUBCASE("filesystem when only the pack map is set") {
    config.distributor.packs_json =
        R"({"layout": {"pack_id": "p", "component_id": "c", "version": "1"}})";
    auto const provider{ config.make_pack_provider() };
    CHECK(dynamic_cast<mosaic::fs_pack_provider *>(provider.get()) != nullptr);
  }

  SUBCASE("distributor when fully configured") {
    config.distributor.url = "https://distributor.test";
    config.distributor.packs_json =
        R"({"layout": {"pack_id": "p", "component_id": "c", "version": "1"}})";
    auto const provider{ config.make_pack_provider() };
    CHECK(dynamic_cast<mosaic::remote_pack_provider *>(provider.get()) != nullptr);
  }
}
