#include "log.h"

#include "doctest.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

// The test runner keeps the logger running; these tests need it stopped.
struct stopped_logger {
  stopped_logger() { mosaic::log::shutdown(); }

  ~stopped_logger() {
    try {
      mosaic::log::set_output_handler([](std::string_view) {});
      mosaic::log::run(std::nullopt);  // also resets the threshold for later tests
    } catch (std::logic_error const &error) {
      FAIL("log teardown should not throw: " << error.what());
    }
  }
};

struct captured_output : stopped_logger {
  std::vector<std::string> messages;

  captured_output() {
    mosaic::log::set_output_handler(
        [this](std::string_view value) { messages.emplace_back(value); });
  }
};

}  // namespace

TEST_CASE("log init can only run once") {
  CHECK_THROWS_AS(mosaic::log::init(), std::logic_error);
}

TEST_CASE("log is running for the whole test run") {
  CHECK_THROWS_AS(mosaic::log::run(std::nullopt), std::logic_error);
  CHECK_THROWS_AS(mosaic::log::set_output_handler([](std::string_view) {}),
                  std::logic_error);
}

TEST_CASE_FIXTURE(stopped_logger, "log allows handler changes while idle") {
  CHECK_NOTHROW(mosaic::log::set_output_handler([](std::string_view) {}));
  CHECK_NOTHROW(mosaic::log::set_output_handler([](std::string_view) {}));
}

TEST_CASE_FIXTURE(stopped_logger, "log enforces run/shutdown sequencing") {
  auto const handler{ [](std::string_view) {} };
  CHECK_NOTHROW(mosaic::log::set_output_handler(handler));
  CHECK_NOTHROW(mosaic::log::run(mosaic::log::level::LOG_INFO));
  CHECK_NOTHROW(mosaic::log::shutdown());

  CHECK_NOTHROW(mosaic::log::run(std::nullopt));
  CHECK_THROWS_AS(mosaic::log::set_output_handler(handler), std::logic_error);
  CHECK_THROWS_AS(mosaic::log::run(std::nullopt), std::logic_error);

  CHECK_NOTHROW(mosaic::log::shutdown());
  CHECK_THROWS_AS(mosaic::log::shutdown(), std::logic_error);

  CHECK_NOTHROW(mosaic::log::set_output_handler(handler));
}

TEST_CASE_FIXTURE(captured_output, "log undecorated messages are raw") {
  CHECK_NOTHROW(mosaic::log::run(std::nullopt, false));
  mosaic::log::info("hello %s %d", "world", 42);
  CHECK_NOTHROW(mosaic::log::shutdown());

  REQUIRE(messages.size() == 1);
  CHECK(messages[0] == "hello world 42\n");
}

TEST_CASE_FIXTURE(captured_output, "log decorated messages include prefix") {
  CHECK_NOTHROW(mosaic::log::run(std::nullopt, true));
  mosaic::log::warn("careful");
  CHECK_NOTHROW(mosaic::log::shutdown());

  REQUIRE(messages.size() == 1);
  CHECK(messages[0].starts_with("["));
  CHECK(messages[0].find("] [WRN] careful\n") != std::string::npos);
}

TEST_CASE_FIXTURE(captured_output, "log severity filtering honors threshold") {
  CHECK_NOTHROW(mosaic::log::run(mosaic::log::level::LOG_WARN, true));
  mosaic::log::debug("debug");
  mosaic::log::info("info");
  mosaic::log::warn("warn");
  mosaic::log::error("error");
  CHECK_NOTHROW(mosaic::log::shutdown());

  REQUIRE(messages.size() == 2);
  CHECK(messages[0].find("WRN") != std::string::npos);
  CHECK(messages[0].find("warn") != std::string::npos);
  CHECK(messages[1].find("ERR") != std::string::npos);
  CHECK(messages[1].find("error") != std::string::npos);
}

TEST_CASE_FIXTURE(captured_output, "log expands long messages") {
  std::string const long_text(4096, 'x');
  CHECK_NOTHROW(mosaic::log::run(std::nullopt));
  mosaic::log::error("%s", long_text.c_str());
  CHECK_NOTHROW(mosaic::log::shutdown());

  REQUIRE(messages.size() == 1);
  CHECK(messages[0] == long_text + "\n");
}

TEST_CASE("log parse_level") {
  CHECK(mosaic::log::parse_level("debug") == mosaic::log::level::LOG_DEBUG);
  CHECK(mosaic::log::parse_level("INFO") == mosaic::log::level::LOG_INFO);
  CHECK(mosaic::log::parse_level("warning") == mosaic::log::level::LOG_WARN);
  CHECK(mosaic::log::parse_level("Warn") == mosaic::log::level::LOG_WARN);
  CHECK(mosaic::log::parse_level("error") == mosaic::log::level::LOG_ERROR);
  CHECK_FALSE(mosaic::log::parse_level("trace").has_value());
  CHECK_FALSE(mosaic::log::parse_level("").has_value());
}
