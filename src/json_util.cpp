#include "json_util.h"

namespace mosaic {

picojson::value json_parse(std::string_view text, std::string_view context) {
  picojson::value root;
  std::string const err{ picojson::parse(root, std::string{ text }) };
  if (!err.empty()) {
    throw std::runtime_error(std::string(context) + ": invalid JSON: " + err);
  }
  return root;
}

picojson::object const &json_as_object(picojson::value const &value,
                                       std::string_view context) {
  if (!value.is<picojson::object>()) {
    throw std::runtime_error(std::string(context) + ": expected a JSON object");
  }
  return value.get<picojson::object>();
}

}  // namespace mosaic
