#include "log.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <queue>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

using mosaic::log::level;

constexpr std::size_t kSeverityLabelWidth{ 3 };
constexpr std::chrono::milliseconds kFlushInterval{ 50 };

struct log_event {
  std::chrono::system_clock::time_point timestamp;
  level severity;
  std::string message;
};

struct logger {
  std::queue<log_event> messages;
  std::function<void(std::string_view)> output_handler;
  std::thread worker;
  std::mutex mutex;         // protects messages queue and cv
  std::mutex stdout_mutex;  // protects raw stdout writes in print_stdout()
  std::condition_variable cv;
  std::atomic_bool stop_requested{ false };
  std::optional<level> level_threshold;
  bool decorated{ false };
  bool initialized{ false };
} s_logger{};

namespace {

std::string_view level_to_string(level value) {
  switch (value) {
    case level::LOG_DEBUG: return "DBG";
    case level::LOG_INFO: return "INF";
    case level::LOG_WARN: return "WRN";
    case level::LOG_ERROR: return "ERR";
  }
  return "UNKNOWN";
}

std::tm make_local_tm(std::time_t time) {
  std::tm result{};
  localtime_r(&time, &result);
  return result;
}

std::string format_prefix(log_event const &event) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(event.timestamp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(event.timestamp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(event.timestamp) };
  std::tm const local_tm{ make_local_tm(timestamp) };

  char timestamp_buf[32]{};
  if (std::strftime(timestamp_buf, sizeof timestamp_buf, "%Y-%m-%d %H:%M:%S", &local_tm) ==
      0) {
    return {};
  }

  std::ostringstream oss;
  oss << '[' << timestamp_buf << '.' << std::setfill('0') << std::setw(3) << millis
      << "] [" << std::left << std::setfill(' ') << std::setw(kSeverityLabelWidth)
      << level_to_string(event.severity) << "] ";
  return oss.str();
}

void flush_messages(std::queue<log_event> &pending,
                    std::function<void(std::string_view)> const &handler) {
  bool wrote_to_stderr{ false };

  while (!pending.empty()) {
    auto event{ std::move(pending.front()) };
    pending.pop();

    std::string output;
    if (s_logger.decorated) {
      auto const prefix{ format_prefix(event) };
      output.reserve(prefix.size() + event.message.size() + 1);
      output.append(prefix);
    } else {
      output.reserve(event.message.size() + 1);
    }
    output.append(event.message);
    output.push_back('\n');

    if (handler) {
      handler(output);
    } else {
      std::fwrite(output.data(), 1, output.size(), stderr);
      wrote_to_stderr = true;
    }
  }

  if (!handler && wrote_to_stderr) { std::fflush(stderr); }
}

void worker_thread() {
  std::unique_lock<std::mutex> lock{ s_logger.mutex };

  while (!s_logger.stop_requested) {
    try {
      std::queue<log_event> pending;
      pending.swap(s_logger.messages);

      lock.unlock();
      flush_messages(pending, s_logger.output_handler);
      lock.lock();

      s_logger.cv.wait_for(lock, kFlushInterval, [] {
        return s_logger.stop_requested.load() || !s_logger.messages.empty();
      });
    } catch (std::exception const &e) {
      if (!lock.owns_lock()) { lock.lock(); }
      std::fprintf(stderr, "[log worker thread exception: %s]\n", e.what());
      std::fflush(stderr);
    }
  }

  // Final flush on shutdown
  try {
    std::queue<log_event> pending;
    pending.swap(s_logger.messages);

    lock.unlock();
    flush_messages(pending, s_logger.output_handler);
  } catch (std::exception const &e) {
    std::fprintf(stderr, "[log final flush exception: %s]\n", e.what());
    std::fflush(stderr);
  }
}

void log_formatted(level severity, char const *fmt, va_list args) {
  if (!s_logger.initialized || fmt == nullptr) { return; }
  if (s_logger.level_threshold && severity < *s_logger.level_threshold) { return; }

  std::string buffer(1024, '\0');

  va_list args_copy;
  va_copy(args_copy, args);
  int written{ std::vsnprintf(buffer.data(), buffer.size(), fmt, args) };
  if (written <= 0) {
    va_end(args_copy);
    return;
  }

  if (static_cast<std::size_t>(written) >= buffer.size()) {
    buffer.resize(static_cast<std::size_t>(written) + 1);
    written = std::vsnprintf(buffer.data(), buffer.size(), fmt, args_copy);
  }
  va_end(args_copy);

  if (written <= 0) { return; }
  buffer.resize(static_cast<std::size_t>(written));

  log_event ev{ .timestamp = std::chrono::system_clock::now(),
                .severity = severity,
                .message = std::move(buffer) };

  {
    std::lock_guard<std::mutex> lock{ s_logger.mutex };
    s_logger.messages.push(std::move(ev));
  }

  s_logger.cv.notify_one();
}

}  // namespace

namespace mosaic::log {

void init() {
  if (s_logger.initialized) {
    throw std::logic_error{ "mosaic::log::init called more than once" };
  }

  s_logger.level_threshold = std::nullopt;
  s_logger.decorated = false;
  s_logger.initialized = true;
}

void run(std::optional<level> threshold, bool decorated_logging) {
  if (!s_logger.initialized) {
    throw std::logic_error{ "mosaic::log::run called before init" };
  }

  if (s_logger.worker.joinable()) {
    throw std::logic_error{ "mosaic::log::run called while already running" };
  }

  s_logger.level_threshold = threshold;
  s_logger.decorated = decorated_logging;
  s_logger.stop_requested = false;
  s_logger.worker = std::thread{ worker_thread };
}

void shutdown() {
  if (!s_logger.worker.joinable()) {
    throw std::logic_error{ "mosaic::log::shutdown called while not running" };
  }

  s_logger.stop_requested = true;
  s_logger.cv.notify_all();
  s_logger.worker.join();
  s_logger.worker = std::thread{};
  s_logger.stop_requested = false;
}

void set_output_handler(std::function<void(std::string_view)> handler) {
  if (!s_logger.initialized) {
    throw std::logic_error{ "mosaic::log::set_output_handler called before init" };
  }

  if (s_logger.worker.joinable()) {
    throw std::logic_error{ "mosaic::log::set_output_handler called while running" };
  }

  std::lock_guard<std::mutex> lock{ s_logger.mutex };
  s_logger.output_handler = std::move(handler);
}

std::optional<level> parse_level(std::string_view name) {
  std::string lowered{ name };
  std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (lowered == "debug") { return level::LOG_DEBUG; }
  if (lowered == "info") { return level::LOG_INFO; }
  if (lowered == "warn" || lowered == "warning") { return level::LOG_WARN; }
  if (lowered == "error") { return level::LOG_ERROR; }
  return std::nullopt;
}

void debug(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_formatted(level::LOG_DEBUG, fmt, args);
  va_end(args);
}

void info(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_formatted(level::LOG_INFO, fmt, args);
  va_end(args);
}

void warn(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_formatted(level::LOG_WARN, fmt, args);
  va_end(args);
}

void error(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_formatted(level::LOG_ERROR, fmt, args);
  va_end(args);
}

void print_stdout(char const *fmt, ...) {
  if (!fmt) { return; }

  std::lock_guard<std::mutex> lock{ s_logger.stdout_mutex };

  va_list args;
  va_start(args, fmt);
  int const written{ std::vprintf(fmt, args) };
  va_end(args);

  if (written > 0) { std::fflush(stdout); }
}

scope::scope(std::optional<level> threshold, bool decorated_logging) {
  if (!s_logger.initialized) { return; }
  run(threshold, decorated_logging);
  active = true;
}

scope::~scope() {
  if (active) { shutdown(); }
}

}  // namespace mosaic::log
