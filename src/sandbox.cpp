#include "sandbox.h"

#include "log.h"

extern "C" {
#include "lauxlib.h"
#include "lua.h"
}

#include "sol/sol.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <mutex>
#include <utility>

namespace mosaic {

namespace {

constexpr int kHookInstructionCount{ 1000 };
constexpr std::size_t kMinimumMemoryBytes{ 256u * 1024u };

// Rough rate of the C loops inside the string and table libraries, which run without
// executing instructions and so never reach the deadline hook.
constexpr double kLibraryStepsPerMillisecond{ 1000000.0 };

constexpr char const *kRemovedGlobals[]{ "dofile", "loadfile", "load", "require",
                                          "collectgarbage" };

// Per-call bookkeeping, reachable from the lua_State through its extra space.
struct sandbox_guard {
  std::size_t memory_limit{ 0 };
  std::size_t memory_used{ 0 };
  bool memory_exceeded{ false };
  std::chrono::steady_clock::time_point deadline{ std::chrono::steady_clock::time_point::max() };
  bool deadline_exceeded{ false };
  std::string fragment_id;
};

// Handed to run_module as a light userdata.
struct module_job {
  compiled_module const &module;
  sandbox_call const &call;
};

void *sandbox_alloc(void *ud, void *ptr, std::size_t osize, std::size_t nsize) {
  auto *guard{ static_cast<sandbox_guard *>(ud) };
  std::size_t const old_size{ ptr ? osize : 0 };  // osize encodes a type tag when ptr is null

  if (nsize == 0) {
    guard->memory_used -= old_size;
    std::free(ptr);
    return nullptr;
  }

  if (nsize > old_size && guard->memory_used - old_size + nsize > guard->memory_limit) {
    guard->memory_exceeded = true;
    return nullptr;
  }

  void *const resized{ std::realloc(ptr, nsize) };
  if (!resized) { return nullptr; }
  guard->memory_used = guard->memory_used - old_size + nsize;
  return resized;
}

sandbox_guard &guard_of(lua_State *lua) {
  return **static_cast<sandbox_guard **>(lua_getextraspace(lua));
}

void deadline_hook(lua_State *lua, lua_Debug *);

int raise_deadline(lua_State *lua) {
  guard_of(lua).deadline_exceeded = true;
  // Fire on every instruction from now on so a pcall in the module cannot absorb it.
  lua_sethook(lua, deadline_hook, LUA_MASKCOUNT, 1);
  return luaL_error(lua, "execution deadline exceeded");
}

void deadline_hook(lua_State *lua, lua_Debug *) {
  auto const &guard{ guard_of(lua) };
  if (!guard.deadline_exceeded && std::chrono::steady_clock::now() < guard.deadline) {
    return;
  }
  raise_deadline(lua);
}

// Raises the deadline error up front when a library loop of `steps` iterations could not
// finish before the deadline.
void charge_library_steps(lua_State *lua, double steps) {
  auto const &guard{ guard_of(lua) };
  double const remaining_ms{ std::chrono::duration<double, std::milli>(
                                 guard.deadline - std::chrono::steady_clock::now())
                                 .count() };
  if (remaining_ms > 0.0 && steps <= remaining_ms * kLibraryStepsPerMillisecond) { return; }
  raise_deadline(lua);
}

// Calls the wrapped library function (upvalue 1) with the current arguments.
int call_wrapped(lua_State *lua) {
  lua_pushvalue(lua, lua_upvalueindex(1));
  lua_insert(lua, 1);
  lua_call(lua, lua_gettop(lua) - 1, LUA_MULTRET);
  return lua_gettop(lua);
}

struct pattern_shape {
  int unbounded{ 0 };  // '*', '+', '-' and %b
  int optional{ 0 };   // '?'
  bool anchored{ false };
};

// Index just past the single-character class starting at p[i].
std::size_t pattern_class_end(std::string_view p, std::size_t i) {
  char const c{ p[i++] };
  if (c == '%') { return std::min(i + 1, p.size()); }
  if (c != '[') { return i; }

  if (i < p.size() && p[i] == '^') { ++i; }
  do {
    if (i >= p.size()) { return p.size(); }  // malformed; the matcher reports it
    if (p[i++] == '%' && i < p.size()) { ++i; }
  } while (i < p.size() && p[i] != ']');
  return std::min(i + 1, p.size());
}

pattern_shape pattern_shape_of(std::string_view p) {
  pattern_shape shape;
  std::size_t i{ 0 };
  if (!p.empty() && p[0] == '^') {
    shape.anchored = true;
    ++i;
  }

  bool trailing_unbounded{ false };
  while (i < p.size()) {
    char const c{ p[i] };
    if (c == '(' || c == ')') {
      ++i;
      continue;
    }
    if (c == '$' && i + 1 == p.size()) { break; }
    if (c == '%' && i + 1 < p.size() && p[i + 1] == 'b') {
      ++shape.unbounded;
      trailing_unbounded = true;
      i += 4;
      continue;
    }
    trailing_unbounded = false;
    if (c == '%' && i + 1 < p.size() && p[i + 1] == 'f') {
      i = (i + 2 < p.size() && p[i + 2] == '[') ? pattern_class_end(p, i + 2) : i + 2;
      continue;
    }

    i = pattern_class_end(p, i);
    if (i >= p.size()) { break; }
    switch (p[i]) {
      case '*':
      case '+':
      case '-':
        ++shape.unbounded, ++i;
        trailing_unbounded = true;
        break;
      case '?': ++shape.optional, ++i; break;
      default: break;
    }
  }

  // Nothing follows the last repetition, so it expands once and never backtracks.
  if (trailing_unbounded) { --shape.unbounded; }
  return shape;
}

// Upper bound on backtracking steps: every quantifier may retry across the whole subject,
// and an unanchored pattern is retried from every start position.
double pattern_steps(std::size_t subject_size, std::size_t pattern_size, pattern_shape shape) {
  double const n{ static_cast<double>(subject_size) + 1.0 };
  int const exponent{ shape.unbounded + (shape.anchored ? 0 : 1) };
  return (static_cast<double>(pattern_size) + 1.0) * std::pow(2.0, shape.optional) *
         std::pow(n, exponent);
}

enum class pattern_fn { find, match, gmatch, gsub };

template <pattern_fn kind>
int guarded_pattern(lua_State *lua) {
  std::size_t subject_size{ 0 };
  std::size_t pattern_size{ 0 };
  luaL_checklstring(lua, 1, &subject_size);
  char const *pattern{ luaL_checklstring(lua, 2, &pattern_size) };

  pattern_shape shape{};
  if (kind != pattern_fn::find || !lua_toboolean(lua, 4)) {  // plain find is a substring scan
    shape = pattern_shape_of({ pattern, pattern_size });
  }
  if (kind == pattern_fn::gmatch) { shape.anchored = false; }

  charge_library_steps(lua, pattern_steps(subject_size, pattern_size, shape));
  return call_wrapped(lua);
}

int guarded_rep(lua_State *lua) {
  std::size_t size{ 0 };
  std::size_t sep_size{ 0 };
  luaL_checklstring(lua, 1, &size);
  lua_Integer const count{ luaL_checkinteger(lua, 2) };
  luaL_optlstring(lua, 3, "", &sep_size);

  if (count > 0) {
    charge_library_steps(lua,
                         static_cast<double>(count) *
                             (static_cast<double>(size + sep_size) + 1.0));
  }
  return call_wrapped(lua);
}

int guarded_move(lua_State *lua) {
  lua_Integer const first{ luaL_checkinteger(lua, 2) };
  lua_Integer const last{ luaL_checkinteger(lua, 3) };
  if (last >= first) {
    charge_library_steps(lua, static_cast<double>(last) - static_cast<double>(first) + 1.0);
  }
  return call_wrapped(lua);
}

// Finalizers run with hooks disabled, so no deadline could stop one.
int guarded_setmetatable(lua_State *lua) {
  if (lua_type(lua, 2) == LUA_TTABLE) {
    lua_pushliteral(lua, "__gc");
    int const gc_type{ lua_rawget(lua, 2) };
    lua_pop(lua, 1);
    if (gc_type != LUA_TNIL) { return luaL_error(lua, "setmetatable: __gc is not available"); }
  }
  return call_wrapped(lua);
}

// Replaces lib[name] (lib on top of the stack) with fn closing over the original.
void wrap_library_function(lua_State *lua, char const *name, lua_CFunction fn) {
  lua_getfield(lua, -1, name);
  lua_pushcclosure(lua, fn, 1);
  lua_setfield(lua, -2, name);
}

int lua_print_override(lua_State *lua) {
  int const argc{ lua_gettop(lua) };
  luaL_Buffer buffer;
  luaL_buffinit(lua, &buffer);

  for (int i{ 1 }; i <= argc; ++i) {
    if (i > 1) { luaL_addchar(&buffer, '\t'); }
    luaL_tolstring(lua, i, nullptr);  // may run a module __tostring
    luaL_addvalue(&buffer);
  }

  luaL_pushresult(&buffer);
  log::info("fragment %s: %s", guard_of(lua).fragment_id.c_str(), lua_tostring(lua, -1));
  return 0;
}

template <void log_func(char const *, ...)>
int lua_print_log(lua_State *lua) {
  log_func("fragment %s: %s", guard_of(lua).fragment_id.c_str(), luaL_checkstring(lua, 1));
  return 0;
}

int bytecode_writer(lua_State *, void const *p, std::size_t size, void *ud) {
  static_cast<std::string *>(ud)->append(static_cast<char const *>(p), size);
  return 0;
}

// Only side-effect-free libraries plus host logging are reachable from a module.
void install_environment(sol::state &lua, std::string_view fragment_id) {
  lua.open_libraries(sol::lib::base,
                     sol::lib::string,
                     sol::lib::table,
                     sol::lib::math,
                     sol::lib::utf8);

  for (char const *name : kRemovedGlobals) { lua[name] = sol::lua_nil; }
  lua["string"]["dump"] = sol::lua_nil;

  lua_State *const L{ lua.lua_state() };

  lua_getglobal(L, "string");
  wrap_library_function(L, "find", guarded_pattern<pattern_fn::find>);
  wrap_library_function(L, "match", guarded_pattern<pattern_fn::match>);
  wrap_library_function(L, "gmatch", guarded_pattern<pattern_fn::gmatch>);
  wrap_library_function(L, "gsub", guarded_pattern<pattern_fn::gsub>);
  wrap_library_function(L, "rep", guarded_rep);
  lua_pop(L, 1);

  lua_getglobal(L, "table");
  wrap_library_function(L, "move", guarded_move);
  lua_pop(L, 1);

  lua_pushglobaltable(L);
  wrap_library_function(L, "setmetatable", guarded_setmetatable);
  lua_pop(L, 1);

  lua_pushcfunction(L, lua_print_override);
  lua_setglobal(L, "print");

  lua_newtable(L);
  lua_newtable(L);
  lua_pushcfunction(L, lua_print_log<log::debug>);
  lua_setfield(L, -2, "debug");
  lua_pushcfunction(L, lua_print_log<log::info>);
  lua_setfield(L, -2, "info");
  lua_pushcfunction(L, lua_print_log<log::warn>);
  lua_setfield(L, -2, "warn");
  lua_pushcfunction(L, lua_print_log<log::error>);
  lua_setfield(L, -2, "error");
  lua_setfield(L, -2, "log");
  lua_pushlstring(L, fragment_id.data(), fragment_id.size());
  lua_setfield(L, -2, "fragment_id");
  lua_setglobal(L, "mosaic");
}

std::string describe_failure(sandbox_guard const &guard,
                             sandbox_limits const &limits,
                             std::string message) {
  if (guard.deadline_exceeded) {
    return "fragment exceeded execution deadline of " +
           std::to_string(limits.deadline.count()) + " ms";
  }
  if (guard.memory_exceeded) {
    return "fragment exceeded memory limit of " + std::to_string(limits.memory_bytes) +
           " bytes";
  }
  return message;
}

// Pushes t[key] read without metamethods and returns true, or pushes nothing and returns
// false when it is nil. Raises when the value has another type than `type`.
bool push_field(lua_State *lua, int t, char const *context, char const *key, int type) {
  lua_pushstring(lua, key);
  int const found{ lua_rawget(lua, t) };
  if (found == LUA_TNIL) {
    lua_pop(lua, 1);
    return false;
  }
  if (found != type) {
    luaL_error(lua, "%s: %s must be a %s", context, key, lua_typename(lua, type));
  }
  return true;
}

void set_string_field(lua_State *lua, char const *key, std::string_view value) {
  lua_pushlstring(lua, value.data(), value.size());
  lua_setfield(lua, -2, key);
}

// Leaves the markup on top of the stack, or raises the module's error.
int interpret_result(lua_State *lua, int first) {
  constexpr char const *ctx{ "render_fragment result" };

  switch (lua_type(lua, first)) {
    case LUA_TSTRING: lua_pushvalue(lua, first); return 1;

    case LUA_TTABLE:
      if (push_field(lua, first, ctx, "err", LUA_TSTRING)) { return lua_error(lua); }
      if (push_field(lua, first, ctx, "ok", LUA_TSTRING)) { return 1; }
      return luaL_error(lua, "render_fragment returned a table without ok or err");

    case LUA_TNIL:
      if (lua_type(lua, first + 1) == LUA_TSTRING) {
        lua_pushvalue(lua, first + 1);
        return lua_error(lua);
      }
      return luaL_error(lua, "render_fragment returned nil");

    default: return luaL_error(lua, "render_fragment returned a %s", luaL_typename(lua, first));
  }
}

// Runs under lua_pcall: every read of a module-owned value happens here, so errors raised
// by metamethods, the deadline hook or the allocator unwind to the protected call.
int run_module(lua_State *lua) {
  auto const &job{ *static_cast<module_job const *>(lua_touserdata(lua, 1)) };
  compiled_module const &module{ job.module };
  sandbox_call const &call{ job.call };

  if (luaL_loadbufferx(lua,
                       module.bytecode.data(),
                       module.bytecode.size(),
                       module.chunk_name.c_str(),
                       "b") != LUA_OK) {
    return lua_error(lua);
  }
  lua_call(lua, 0, 1);
  int const exports{ lua_gettop(lua) };

  bool has_entry{ false };
  if (lua_type(lua, exports) == LUA_TTABLE) {
    constexpr char const *ctx{ "module exports" };

    if (push_field(lua, exports, ctx, "world", LUA_TSTRING)) {
      std::size_t world_size{ 0 };
      char const *world{ lua_tolstring(lua, -1, &world_size) };
      std::string_view const module_world{ world, world_size };
      if (!module_world.empty() && !call.component_world.empty() &&
          module_world != call.component_world) {
        lua_pushliteral(lua, "module world '");
        lua_pushvalue(lua, -2);
        lua_pushliteral(lua, "' does not match binding world '");
        lua_pushlstring(lua, call.component_world.data(), call.component_world.size());
        lua_pushliteral(lua, "'");
        lua_concat(lua, 5);
        return lua_error(lua);
      }
      lua_pop(lua, 1);
    }

    has_entry = push_field(lua, exports, ctx, "render_fragment", LUA_TFUNCTION);
  }

  if (!has_entry) {
    lua_rawgeti(lua, LUA_REGISTRYINDEX, LUA_RIDX_GLOBALS);
    lua_pushliteral(lua, "render_fragment");
    if (lua_rawget(lua, -2) != LUA_TFUNCTION) {
      return luaL_error(lua, "module does not define render_fragment");
    }
    lua_remove(lua, -2);
  }

  lua_pushlstring(lua, call.fragment_id.data(), call.fragment_id.size());
  lua_createtable(lua, 0, 4);
  set_string_field(lua, "tenant_ctx", call.ctx.tenant_ctx);
  set_string_field(lua, "user_ctx", call.ctx.user_ctx);
  set_string_field(lua, "route", call.ctx.route);
  set_string_field(lua, "session_id", call.ctx.session_id);

  lua_call(lua, 2, 2);
  return interpret_result(lua, lua_gettop(lua) - 1);
}

}  // namespace

compiled_module sandbox_compile(std::string_view source, std::filesystem::path path) {
  std::string chunk_name{ "@" + path.string() };

  std::unique_ptr<lua_State, decltype(&lua_close)> lua{ luaL_newstate(), &lua_close };
  if (!lua) { throw sandbox_error("failed to create Lua state"); }

  if (luaL_loadbufferx(lua.get(), source.data(), source.size(), chunk_name.c_str(), "t") !=
      LUA_OK) {
    char const *err{ lua_tostring(lua.get(), -1) };
    throw sandbox_error(std::string("failed to compile module: ") +
                        (err ? err : "unknown error"));
  }

  std::string bytecode;
  if (lua_dump(lua.get(), bytecode_writer, &bytecode, 0) != 0) {
    throw sandbox_error("failed to dump bytecode for " + path.string());
  }

  return { .path = std::move(path),
           .chunk_name = std::move(chunk_name),
           .bytecode = std::move(bytecode) };
}

module_engine::module_engine(sandbox_limits limits) : limits_{ limits } {
  if (limits_.deadline.count() <= 0) {
    throw std::invalid_argument("module_engine: deadline must be positive");
  }
  if (limits_.memory_bytes < kMinimumMemoryBytes) {
    throw std::invalid_argument("module_engine: memory limit must be at least " +
                                std::to_string(kMinimumMemoryBytes) + " bytes");
  }
}

std::shared_ptr<compiled_module const> module_engine::load(
    std::filesystem::path const &path) {
  std::string const key{ path.lexically_normal().string() };
  {
    std::shared_lock const lock{ mutex_ };
    if (auto const it{ modules_.find(key) }; it != modules_.end()) { return it->second; }
  }

  auto compiled{ std::make_shared<compiled_module const>(
      sandbox_compile(util_load_text_file(path), path)) };
  ++compilations_;

  std::unique_lock const lock{ mutex_ };
  auto const [it, inserted]{ modules_.emplace(key, std::move(compiled)) };
  if (inserted) { log::debug("compiled fragment module %s", key.c_str()); }
  return it->second;
}

std::string module_engine::invoke(compiled_module const &module,
                                  sandbox_call const &call) const {
  sandbox_guard guard{ .memory_limit = limits_.memory_bytes,
                       .fragment_id = std::string(call.fragment_id) };
  module_job job{ .module = module, .call = call };

  try {
    sol::state lua{ sol::default_at_panic, sandbox_alloc, &guard };
    lua_State *const L{ lua.lua_state() };
    *static_cast<sandbox_guard **>(lua_getextraspace(L)) = &guard;
    install_environment(lua, call.fragment_id);

    guard.deadline = std::chrono::steady_clock::now() + limits_.deadline;
    lua_sethook(L, deadline_hook, LUA_MASKCOUNT, kHookInstructionCount);

    lua_pushcfunction(L, run_module);
    lua_pushlightuserdata(L, &job);
    if (lua_pcall(L, 1, 1, 0) != LUA_OK) {
      char const *message{ lua_type(L, -1) == LUA_TSTRING ? lua_tostring(L, -1) : nullptr };
      throw sandbox_error(
          describe_failure(guard, limits_, message ? message : "unknown error"));
    }

    std::size_t size{ 0 };
    char const *html{ lua_tolstring(L, -1, &size) };
    return { html, size };
  } catch (sandbox_error const &) {
    throw;
  } catch (std::runtime_error const &e) {
    throw sandbox_error(describe_failure(guard, limits_, e.what()));
  }
}

}  // namespace mosaic
