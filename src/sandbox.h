#pragma once

#include "fragment_renderer.h"
#include "util.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mosaic {

struct sandbox_limits {
  std::chrono::milliseconds deadline{ 250 };
  std::size_t memory_bytes{ 16u * 1024u * 1024u };
};

// A module failed to compile, load or run, or broke a limit.
class sandbox_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct compiled_module {
  std::filesystem::path path;
  std::string chunk_name;  // "@<path>", used in Lua error messages
  std::string bytecode;
};

// Compile a Lua source chunk (binary chunks are rejected) into bytecode. Throws
// sandbox_error on syntax errors.
compiled_module sandbox_compile(std::string_view source, std::filesystem::path path);

struct sandbox_call {
  std::string_view fragment_id;
  std::string_view component_world;  // empty: no world check
  fragment_context const &ctx;
};

// Process-wide holder of compiled fragment modules. Compiled modules are cached by path;
// every invocation runs in a fresh Lua state bounded by the configured limits.
class module_engine : unmovable {
 public:
  explicit module_engine(sandbox_limits limits = {});

  // Cached per path. Compilation happens outside the lock; the first insert wins.
  // Throws std::runtime_error when the file cannot be read, sandbox_error when it does
  // not compile.
  std::shared_ptr<compiled_module const> load(std::filesystem::path const &path);

  // Runs the module's render_fragment entry point and returns its markup. Throws
  // sandbox_error for any module failure.
  std::string invoke(compiled_module const &module, sandbox_call const &call) const;

  sandbox_limits const &limits() const { return limits_; }
  std::size_t compilations() const { return compilations_.load(); }

 private:
  sandbox_limits limits_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<compiled_module const>> modules_;
  std::atomic<std::size_t> compilations_{ 0 };
};

}  // namespace mosaic
