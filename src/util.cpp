#include "util.h"

#include <cctype>
#include <cstdio>
#include <random>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace mosaic {

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::vector<unsigned char> util_load_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_file: failed to open file: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_END) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to end: " + path.string());
  }

  long const file_size{ std::ftell(file.get()) };
  if (file_size < 0) {
    throw std::runtime_error("util_load_file: failed to get file size: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_SET) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to start: " + path.string());
  }

  std::vector<unsigned char> buffer(static_cast<size_t>(file_size));
  if (file_size > 0) {
    size_t const bytes_read{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    if (bytes_read != buffer.size()) {
      throw std::runtime_error("util_load_file: failed to read entire file: " +
                               path.string());
    }
  }

  return buffer;
}

std::string util_load_text_file(std::filesystem::path const &path) {
  auto const bytes{ util_load_file(path) };
  return { reinterpret_cast<char const *>(bytes.data()), bytes.size() };
}

void util_write_file(std::filesystem::path const &path, std::string_view content) {
  if (auto const parent{ path.parent_path() }; !parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw std::runtime_error("util_write_file: failed to create directory " +
                               parent.string() + ": " + ec.message());
    }
  }

  auto file{ util_open_file(path, "wb") };
  if (!file) {
    throw std::runtime_error("util_write_file: failed to open file: " + path.string());
  }

  if (!content.empty() &&
      std::fwrite(content.data(), 1, content.size(), file.get()) != content.size()) {
    throw std::runtime_error("util_write_file: short write: " + path.string());
  }
}

std::string_view util_trim(std::string_view value) {
  auto const is_space{ [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  } };
  while (!value.empty() && is_space(value.front())) { value.remove_prefix(1); }
  while (!value.empty() && is_space(value.back())) { value.remove_suffix(1); }
  return value;
}

std::string util_random_hex(std::size_t bytes) {
  static constexpr char hex_chars[] = "0123456789abcdef";
  thread_local std::mt19937_64 rng{ std::random_device{}() };

  std::string result;
  result.reserve(bytes * 2);
  std::uniform_int_distribution<int> dist{ 0, 255 };
  for (std::size_t i{}; i < bytes; ++i) {
    int const value{ dist(rng) };
    result += hex_chars[(value >> 4) & 0xf];
    result += hex_chars[value & 0xf];
  }
  return result;
}

std::filesystem::path util_make_temp_dir(std::string_view prefix) {
  auto const base{ std::filesystem::temp_directory_path() };
  if (!std::filesystem::exists(base)) {
    throw std::runtime_error("Temporary directory base does not exist");
  }

  auto const candidate{ base / (std::string{ prefix } + util_random_hex(8)) };

  std::error_code ec;
  std::filesystem::remove_all(candidate, ec);
  std::filesystem::create_directories(candidate, ec);
  if (ec) {
    throw std::runtime_error("Failed to create temporary directory " +
                             candidate.string() + ": " + ec.message());
  }
  return candidate;
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

std::filesystem::path scoped_path_cleanup::release() {
  return std::exchange(path_, std::filesystem::path{});
}

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  path_.clear();
}

}  // namespace mosaic
