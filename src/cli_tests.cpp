#include "cli.h"

#include "util.h"

#include "doctest.h"

#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace {

// Helper to convert vector of strings to argc/argv
std::vector<char *> make_argv(std::vector<std::string> &args) {
  std::vector<char *> argv;
  for (auto &arg : args) { argv.push_back(arg.data()); }
  argv.push_back(nullptr);
  return argv;
}

mosaic::cli_args parse(std::vector<std::string> args) {
  auto argv{ make_argv(args) };
  return mosaic::cli_parse(static_cast<int>(args.size()), argv.data());
}

}  // anonymous namespace

TEST_CASE("cli_parse: no arguments") {
  auto const parsed{ parse({ "mosaic" }) };

  // With no arguments, help text returned and no command configuration.
  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK(parsed.cli_output.find("resolve") != std::string::npos);
}

TEST_CASE("cli_parse: cmd_version") {
  SUBCASE("-v flag") {
    auto const parsed{ parse({ "mosaic", "-v" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<mosaic::cmd_version::cfg>(*parsed.cmd_cfg));
  }

  SUBCASE("--version flag") {
    auto const parsed{ parse({ "mosaic", "--version" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<mosaic::cmd_version::cfg>(*parsed.cmd_cfg));
  }

  SUBCASE("subcommand") {
    auto const parsed{ parse({ "mosaic", "version" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<mosaic::cmd_version::cfg>(*parsed.cmd_cfg));
  }
}

TEST_CASE("cli_parse: cmd_resolve") {
  SUBCASE("path only") {
    auto const parsed{ parse({ "mosaic", "resolve", "/invoices" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const *cfg{ std::get_if<mosaic::cmd_resolve::cfg>(&*parsed.cmd_cfg) };
    REQUIRE(cfg != nullptr);
    CHECK(cfg->path == "/invoices");
    CHECK_FALSE(cfg->session_token.has_value());
  }

  SUBCASE("with session") {
    auto const parsed{ parse({ "mosaic", "resolve", "/invoices", "--session", "tok" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const *cfg{ std::get_if<mosaic::cmd_resolve::cfg>(&*parsed.cmd_cfg) };
    REQUIRE(cfg != nullptr);
    REQUIRE(cfg->session_token.has_value());
    CHECK(*cfg->session_token == "tok");
  }

  SUBCASE("missing path rejected") {
    auto const parsed{ parse({ "mosaic", "resolve" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK_FALSE(parsed.cli_output.empty());
  }
}

TEST_CASE("cli_parse: cmd_render") {
  auto const parsed{ parse({ "mosaic",
                             "render",
                             "/invoices",
                             "--session",
                             "tok",
                             "--user",
                             "user-7",
                             "--static-only" }) };
  REQUIRE(parsed.cmd_cfg.has_value());
  auto const *cfg{ std::get_if<mosaic::cmd_render::cfg>(&*parsed.cmd_cfg) };
  REQUIRE(cfg != nullptr);
  CHECK(cfg->path == "/invoices");
  CHECK(cfg->session_token == "tok");
  CHECK(cfg->user_id == "user-7");
  CHECK(cfg->static_only);
}

TEST_CASE("cli_parse: cmd_config and cmd_packs") {
  auto const config{ parse({ "mosaic", "config" }) };
  REQUIRE(config.cmd_cfg.has_value());
  CHECK(std::holds_alternative<mosaic::cmd_config::cfg>(*config.cmd_cfg));

  auto const packs{ parse({ "mosaic", "packs" }) };
  REQUIRE(packs.cmd_cfg.has_value());
  CHECK(std::holds_alternative<mosaic::cmd_packs::cfg>(*packs.cmd_cfg));
}

TEST_CASE("cli_parse: global options populate app_config") {
  auto const parsed{ parse({ "mosaic",
                             "--pack-root",
                             "/srv/packs",
                             "--default-tenant",
                             "fallback",
                             "--domain",
                             "acme.example.com",
                             "--tenant-map",
                             R"({"acme.example.com": "acme"})",
                             "--env",
                             "prod",
                             "--distributor-url",
                             "https://distributor.test",
                             "--distributor-token",
                             "secret",
                             "--fragment-timeout-ms",
                             "100",
                             "--fragment-memory-mb",
                             "8",
                             "config" }) };
  REQUIRE(parsed.cmd_cfg.has_value());
  CHECK(parsed.cli_output.empty());

  auto const &config{ parsed.config };
  CHECK(config.pack_root == "/srv/packs");
  CHECK(config.default_tenant == "fallback");
  CHECK(config.domain == "acme.example.com");
  CHECK(config.effective_tenant() == "acme");
  CHECK(config.environment_id == "prod");
  CHECK(config.distributor.url == "https://distributor.test");
  CHECK(config.distributor.token == "secret");
  CHECK(config.fragment_timeout_ms == 100u);
  CHECK(config.fragment_memory_mb == 8u);
}

TEST_CASE("cli_parse: --tenant overrides the domain mapping") {
  auto const parsed{ parse({ "mosaic",
                             "--tenant",
                             "globex",
                             "--domain",
                             "acme.example.com",
                             "--tenant-map",
                             R"({"acme.example.com": "acme"})",
                             "packs" }) };
  REQUIRE(parsed.cmd_cfg.has_value());
  CHECK(parsed.config.effective_tenant() == "globex");
}

TEST_CASE("cli_parse: logging options") {
  SUBCASE("default is info, undecorated") {
    auto const parsed{ parse({ "mosaic", "config" }) };
    CHECK(parsed.verbosity == mosaic::log::level::LOG_INFO);
    CHECK_FALSE(parsed.decorated_logging);
  }

  SUBCASE("--verbose enables decorated debug") {
    auto const parsed{ parse({ "mosaic", "--verbose", "config" }) };
    CHECK(parsed.verbosity == mosaic::log::level::LOG_DEBUG);
    CHECK(parsed.decorated_logging);
  }

  SUBCASE("--log-level overrides") {
    auto const parsed{ parse({ "mosaic", "--verbose", "--log-level", "warn", "config" }) };
    CHECK(parsed.verbosity == mosaic::log::level::LOG_WARN);
  }

  SUBCASE("invalid level") {
    auto const parsed{ parse({ "mosaic", "--log-level", "loud", "config" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK(parsed.cli_output == "Invalid log level: loud");
  }
}

TEST_CASE("cli_parse: invalid tenant map") {
  auto const parsed{ parse({ "mosaic", "--tenant-map", R"({"a.test": 1})", "config" }) };
  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK(parsed.cli_output.find("tenant map") != std::string::npos);
}

TEST_CASE("cli_parse: zero fragment timeout rejected") {
  auto const parsed{ parse({ "mosaic", "--fragment-timeout-ms", "0", "config" }) };
  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK_FALSE(parsed.cli_output.empty());
}
