#pragma once

#include "picojson.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace mosaic {

// Parse a JSON document. Throws std::runtime_error prefixed with context on syntax errors.
picojson::value json_parse(std::string_view text, std::string_view context);

// Throws unless value is a JSON object.
picojson::object const &json_as_object(picojson::value const &value,
                                       std::string_view context);

namespace detail {

template <typename T>
constexpr std::string_view json_type_name_for_error() {
  if constexpr (std::is_same_v<T, bool>) {
    return "boolean";
  } else if constexpr (std::is_same_v<T, std::string>) {
    return "string";
  } else if constexpr (std::is_same_v<T, picojson::object>) {
    return "object";
  } else if constexpr (std::is_same_v<T, picojson::array>) {
    return "array";
  } else if constexpr (std::is_same_v<T, double>) {
    return "number";
  } else {
    return "value";
  }
}

}  // namespace detail

template <typename T>
std::optional<T> json_get_optional(picojson::object const &object,
                                   std::string_view key,
                                   std::string_view context) {
  auto const it{ object.find(std::string{ key }) };
  if (it == object.end() || it->second.is<picojson::null>()) { return std::nullopt; }

  if (!it->second.is<T>()) {
    throw std::runtime_error(std::string(context) + ": " + std::string(key) +
                             " must be a " +
                             std::string(detail::json_type_name_for_error<T>()));
  }

  return it->second.get<T>();
}

template <typename T>
T json_get_required(picojson::object const &object,
                    std::string_view key,
                    std::string_view context) {
  auto value{ json_get_optional<T>(object, key, context) };
  if (!value) {
    throw std::runtime_error(std::string(context) + ": " + std::string(key) +
                             " is required");
  }
  return std::move(*value);
}

template <typename T>
T json_get_or_default(picojson::object const &object,
                      std::string_view key,
                      T const &default_value,
                      std::string_view context) {
  auto opt{ json_get_optional<T>(object, key, context) };
  return opt.value_or(default_value);
}

}  // namespace mosaic
