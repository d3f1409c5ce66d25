#include "css_selector.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace mosaic {

namespace {

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

bool is_ident_char(char c) {
  auto const u{ static_cast<unsigned char>(c) };
  return std::isalnum(u) != 0 || c == '-' || c == '_' || u >= 0x80;
}

std::string to_lower(std::string_view s) {
  std::string out{ s };
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

class selector_parser {
 public:
  explicit selector_parser(std::string_view text) : text_{ text } {}

  css_selector parse() {
    css_selector result;
    while (true) {
      result.alternatives.push_back(parse_complex());
      skip_space();
      if (at_end()) { break; }
      if (peek() != ',') { fail("unexpected character"); }
      ++pos_;
    }
    return result;
  }

 private:
  bool at_end() const { return pos_ >= text_.size(); }
  char peek() const { return text_[pos_]; }

  [[noreturn]] void fail(std::string_view what) const {
    throw css_selector_error("invalid selector '" + std::string(text_) + "': " +
                             std::string(what) + " at offset " + std::to_string(pos_));
  }

  void skip_space() {
    while (!at_end() && is_space(peek())) { ++pos_; }
  }

  std::string parse_ident() {
    std::size_t const start{ pos_ };
    while (!at_end() && is_ident_char(peek())) { ++pos_; }
    if (pos_ == start) { fail("expected identifier"); }
    return std::string(text_.substr(start, pos_ - start));
  }

  complex_selector parse_complex() {
    complex_selector result;
    skip_space();
    result.compounds.push_back(parse_compound());

    while (true) {
      std::size_t const before{ pos_ };
      skip_space();
      if (at_end() || peek() == ',') { break; }

      css_combinator comb{ css_combinator::descendant };
      if (peek() == '>') {
        comb = css_combinator::child;
        ++pos_;
        skip_space();
        if (at_end()) { fail("dangling combinator"); }
      } else if (pos_ == before) {
        fail("unexpected character");
      }

      result.combinators.push_back(comb);
      result.compounds.push_back(parse_compound());
    }
    return result;
  }

  compound_selector parse_compound() {
    compound_selector result;
    bool any{ false };

    if (!at_end() && peek() == '*') {
      ++pos_;
      any = true;
    } else if (!at_end() && is_ident_char(peek())) {
      result.tag = to_lower(parse_ident());
      any = true;
    }

    while (!at_end()) {
      char const c{ peek() };
      if (c == '#') {
        ++pos_;
        result.ids.push_back(parse_ident());
      } else if (c == '.') {
        ++pos_;
        result.classes.push_back(parse_ident());
      } else if (c == '[') {
        ++pos_;
        result.attributes.push_back(parse_attribute());
      } else {
        break;
      }
      any = true;
    }

    if (!any) { fail("expected selector"); }
    return result;
  }

  attribute_selector parse_attribute() {
    attribute_selector result;
    skip_space();
    result.name = to_lower(parse_ident());
    skip_space();
    if (at_end()) { fail("unterminated attribute selector"); }

    if (peek() == ']') {
      ++pos_;
      return result;
    }

    switch (peek()) {
      case '=': result.match = attribute_selector::op::equals; break;
      case '~': result.match = attribute_selector::op::includes; break;
      case '^': result.match = attribute_selector::op::prefix; break;
      case '$': result.match = attribute_selector::op::suffix; break;
      case '*': result.match = attribute_selector::op::substring; break;
      default: fail("unknown attribute operator");
    }
    ++pos_;
    if (result.match != attribute_selector::op::equals) {
      if (at_end() || peek() != '=') { fail("expected '='"); }
      ++pos_;
    }

    skip_space();
    if (at_end()) { fail("missing attribute value"); }

    if (char const quote{ peek() }; quote == '"' || quote == '\'') {
      ++pos_;
      std::size_t const start{ pos_ };
      while (!at_end() && peek() != quote) { ++pos_; }
      if (at_end()) { fail("unterminated string"); }
      result.value = std::string(text_.substr(start, pos_ - start));
      ++pos_;
    } else {
      result.value = parse_ident();
    }

    skip_space();
    if (at_end() || peek() != ']') { fail("expected ']'"); }
    ++pos_;
    return result;
  }

  std::string_view text_;
  std::size_t pos_{ 0 };
};

}  // namespace

css_selector css_selector_parse(std::string_view text) {
  return selector_parser{ text }.parse();
}

bool css_class_list_contains(std::string_view class_list, std::string_view name) {
  std::size_t pos{ 0 };
  while (pos < class_list.size()) {
    while (pos < class_list.size() && is_space(class_list[pos])) { ++pos; }
    std::size_t const start{ pos };
    while (pos < class_list.size() && !is_space(class_list[pos])) { ++pos; }
    if (pos > start && class_list.substr(start, pos - start) == name) { return true; }
  }
  return false;
}

bool css_attribute_value_matches(attribute_selector const &sel, std::string_view value) {
  using op = attribute_selector::op;
  switch (sel.match) {
    case op::exists: return true;
    case op::equals: return value == sel.value;
    case op::includes: return !sel.value.empty() && css_class_list_contains(value, sel.value);
    case op::prefix: return !sel.value.empty() && value.starts_with(sel.value);
    case op::suffix: return !sel.value.empty() && value.ends_with(sel.value);
    case op::substring:
      return !sel.value.empty() && value.find(sel.value) != std::string_view::npos;
  }
  return false;
}

}  // namespace mosaic
