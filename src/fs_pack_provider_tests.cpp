#include "fs_pack_provider.h"

#include "test_support.h"
#include "util.h"

#include "doctest.h"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace {

struct pack_tree {
  std::filesystem::path root{ mosaic::util_make_temp_dir("mosaic-fs-provider-test-") };
  mosaic::scoped_path_cleanup cleanup{ root };
};

}  // namespace

TEST_CASE_FIXTURE(pack_tree, "fs_pack_provider loads each kind for a tenant") {
  mosaic::test::write_acme_tenant(root, true);
  mosaic::fs_pack_provider provider{ root };

  auto const layout{ provider.load_layout("acme") };
  CHECK(layout.manifest.entrypoint_html == "index.html");
  CHECK(layout.root == root / "acme" / "10-layout");

  auto const auth{ provider.load_auth("acme") };
  REQUIRE(auth.has_value());
  CHECK(auth->manifest.routes.front().path == "/signin");

  auto const features{ provider.load_features("acme") };
  REQUIRE(features.size() == 1);
  CHECK(features[0].manifest.routes[0].path == "/invoices");

  CHECK_FALSE(provider.load_skin("acme").has_value());
  CHECK_FALSE(provider.load_telemetry("acme").has_value());
}

TEST_CASE_FIXTURE(pack_tree, "fs_pack_provider orders feature packs lexicographically") {
  auto const feature{ [&](char const *dir, char const *path) {
    mosaic::test::write_manifest(
        root / "t" / dir,
        std::string(R"({"kind": "gui-feature", "routes": [{"path": ")") + path +
            R"(", "html": "x.html"}]})");
  } };
  feature("b-second", "/b");
  feature("a-first", "/a");
  feature("c-third", "/c");

  mosaic::fs_pack_provider provider{ root };
  auto const features{ provider.load_features("t") };
  REQUIRE(features.size() == 3);
  CHECK(features[0].manifest.routes[0].path == "/a");
  CHECK(features[1].manifest.routes[0].path == "/b");
  CHECK(features[2].manifest.routes[0].path == "/c");
}

TEST_CASE_FIXTURE(pack_tree, "fs_pack_provider first pack of a singular kind wins") {
  mosaic::test::write_manifest(root / "t" / "skin-b", R"({"kind": "gui-skin"})");
  mosaic::test::write_manifest(root / "t" / "skin-a", R"({"kind": "gui-skin"})");

  mosaic::fs_pack_provider provider{ root };
  auto const skin{ provider.load_skin("t") };
  REQUIRE(skin.has_value());
  CHECK(skin->root.filename() == "skin-a");
}

TEST_CASE_FIXTURE(pack_tree, "fs_pack_provider without a layout throws") {
  mosaic::test::write_manifest(root / "t" / "skin", R"({"kind": "gui-skin"})");
  mosaic::fs_pack_provider provider{ root };

  CHECK_THROWS_AS(provider.load_layout("t"), std::runtime_error);
  CHECK_THROWS_AS(provider.load_layout("unknown-tenant"), std::runtime_error);
}

TEST_CASE_FIXTURE(pack_tree, "fs_pack_provider unknown tenant has no optional packs") {
  mosaic::fs_pack_provider provider{ root };
  CHECK(provider.load_features("nobody").empty());
  CHECK_FALSE(provider.load_auth("nobody").has_value());
}

TEST_CASE_FIXTURE(pack_tree, "fs_pack_provider surfaces unreadable manifests") {
  std::filesystem::create_directories(root / "t" / "broken");
  mosaic::fs_pack_provider provider{ root };
  CHECK_THROWS_AS(provider.load_features("t"), std::runtime_error);
}

TEST_CASE_FIXTURE(pack_tree, "fs_pack_provider reports schema errors") {
  mosaic::test::write_manifest(root / "t" / "layout",
                               R"({"kind": "gui-layout", "layout": {}})");
  mosaic::fs_pack_provider provider{ root };
  CHECK_THROWS_AS(provider.load_layout("t"), mosaic::manifest_error);
}
