#pragma once

#include <functional>
#include <optional>
#include <string_view>

#if defined(__clang__) || defined(__GNUC__)
#define MOSAIC_LOG_PRINTF(idx, first) __attribute__((format(printf, idx, first)))
#else
#define MOSAIC_LOG_PRINTF(idx, first)
#endif

namespace mosaic::log {

enum class level { LOG_DEBUG, LOG_INFO, LOG_WARN, LOG_ERROR };

void init();
void set_output_handler(std::function<void(std::string_view)> handler);
void run(std::optional<level> threshold = std::nullopt, bool decorated_logging = false);
void shutdown();

// Case-insensitive: "debug", "info", "warn"/"warning", "error".
std::optional<level> parse_level(std::string_view name);

void debug(char const *fmt, ...) MOSAIC_LOG_PRINTF(1, 2);
void info(char const *fmt, ...) MOSAIC_LOG_PRINTF(1, 2);
void warn(char const *fmt, ...) MOSAIC_LOG_PRINTF(1, 2);
void error(char const *fmt, ...) MOSAIC_LOG_PRINTF(1, 2);

void print_stdout(char const *fmt, ...) MOSAIC_LOG_PRINTF(1, 2);

struct scope {  // raii helper
  explicit scope(std::optional<level> threshold, bool decorated_logging);
  ~scope();

 private:
  bool active{ false };
};

}  // namespace mosaic::log
