#include "fragment_renderer.h"

#include "test_support.h"
#include "util.h"

#include "doctest.h"

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace {

class scripted_renderer : public mosaic::fragment_renderer {
 public:
  explicit scripted_renderer(mosaic::render_outcome outcome) : outcome_{ std::move(outcome) } {}

  mosaic::render_outcome render(mosaic::fragment_binding const &,
                                std::filesystem::path const &,
                                mosaic::fragment_context const &) override {
    ++calls;
    return outcome_;
  }

  int calls{ 0 };

 private:
  mosaic::render_outcome outcome_;
};

mosaic::fragment_binding const kBinding{ .id = "summary", .selector = "#summary" };
mosaic::fragment_context const kCtx{};

}  // namespace

TEST_CASE("composite_fragment_renderer falls through only on no opinion") {
  auto const silent{ std::make_shared<scripted_renderer>(mosaic::fragment_no_opinion{}) };
  auto const markup{ std::make_shared<scripted_renderer>(mosaic::fragment_markup{ "<p/>" }) };
  auto const never{ std::make_shared<scripted_renderer>(mosaic::fragment_markup{ "never" }) };

  mosaic::composite_fragment_renderer composite{ { silent, nullptr, markup, never } };
  auto const outcome{ composite.render(kBinding, "/assets", kCtx) };

  REQUIRE(std::holds_alternative<mosaic::fragment_markup>(outcome));
  CHECK(std::get<mosaic::fragment_markup>(outcome).html == "<p/>");
  CHECK(silent->calls == 1);
  CHECK(markup->calls == 1);
  CHECK(never->calls == 0);
}

TEST_CASE("composite_fragment_renderer stops on errors") {
  auto const secrets{ std::make_shared<scripted_renderer>(
      mosaic::fragment_missing_secrets{ "missing_secrets: KEY" }) };
  auto const markup{ std::make_shared<scripted_renderer>(mosaic::fragment_markup{ "<p/>" }) };

  mosaic::composite_fragment_renderer composite{ { secrets, markup } };
  CHECK(std::holds_alternative<mosaic::fragment_missing_secrets>(
      composite.render(kBinding, "/assets", kCtx)));
  CHECK(markup->calls == 0);
}

TEST_CASE("composite_fragment_renderer with no stages has no opinion") {
  mosaic::composite_fragment_renderer composite{ {} };
  CHECK(std::holds_alternative<mosaic::fragment_no_opinion>(
      composite.render(kBinding, "/assets", kCtx)));
}

TEST_CASE("file_fragment_renderer reads fragments/<id>.html") {
  auto const root{ mosaic::util_make_temp_dir("mosaic-file-renderer-test-") };
  mosaic::scoped_path_cleanup cleanup{ root };
  mosaic::file_fragment_renderer renderer;

  CHECK(std::holds_alternative<mosaic::fragment_no_opinion>(
      renderer.render(kBinding, mosaic::pack_assets_root(root), kCtx)));

  mosaic::test::write_asset(root, "fragments/summary.html", "<div>cached</div>");
  auto const outcome{ renderer.render(kBinding, mosaic::pack_assets_root(root), kCtx) };
  REQUIRE(std::holds_alternative<mosaic::fragment_markup>(outcome));
  CHECK(std::get<mosaic::fragment_markup>(outcome).html == "<div>cached</div>");
}
