#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest.h"

#include "log.h"

#include <optional>
#include <string_view>

int main(int argc, char **argv) {
  doctest::Context context;
  context.applyCommandLine(argc, argv);

  mosaic::log::init();
  mosaic::log::set_output_handler([](std::string_view) {});
  mosaic::log::scope log_scope{ std::nullopt, false };

  return context.run();
}
