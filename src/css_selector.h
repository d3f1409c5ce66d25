#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace mosaic {

class css_selector_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct attribute_selector {
  enum class op {
    exists,     // [a]
    equals,     // [a=v]
    includes,   // [a~=v] whitespace-separated word
    prefix,     // [a^=v]
    suffix,     // [a$=v]
    substring,  // [a*=v]
  };

  std::string name;  // lowercase
  op match{ op::exists };
  std::string value;
};

struct compound_selector {
  std::string tag;  // lowercase; empty matches any element
  std::vector<std::string> ids;
  std::vector<std::string> classes;
  std::vector<attribute_selector> attributes;
};

enum class css_combinator { descendant, child };

struct complex_selector {
  std::vector<compound_selector> compounds;
  std::vector<css_combinator> combinators;  // combinators[i] joins compounds[i], [i + 1]
};

// A selector list: matches when any alternative matches.
struct css_selector {
  std::vector<complex_selector> alternatives;
};

// Supports type, universal, #id, .class and attribute selectors joined by descendant and
// child combinators, in comma-separated lists. Throws css_selector_error otherwise.
css_selector css_selector_parse(std::string_view text);

// True when value matches the attribute selector's operator (ignores the name).
bool css_attribute_value_matches(attribute_selector const &sel, std::string_view value);

// True when class_list (space-separated) contains name.
bool css_class_list_contains(std::string_view class_list, std::string_view name);

}  // namespace mosaic
