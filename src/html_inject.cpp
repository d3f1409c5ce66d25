#include "html_inject.h"

#include <libxml/HTMLparser.h>
#include <libxml/HTMLtree.h>
#include <libxml/parser.h>

#include <cctype>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace mosaic {

namespace {

constexpr char kWrapperId[]{ "__mosaic_fragment_wrapper" };

constexpr int kParseOptions{ HTML_PARSE_RECOVER | HTML_PARSE_NONET | HTML_PARSE_NOERROR |
                             HTML_PARSE_NOWARNING | HTML_PARSE_NODEFDTD };

void libxml_ensure_initialized() {
  static std::once_flag once;
  std::call_once(once, [] { xmlInitParser(); });
}

xml_doc_ptr_t read_html(std::string_view html, int extra_options) {
  libxml_ensure_initialized();
  return xml_doc_ptr_t{ htmlReadMemory(html.data(),
                                       static_cast<int>(html.size()),
                                       nullptr,
                                       "UTF-8",
                                       kParseOptions | extra_options) };
}

char const *as_chars(xmlChar const *s) { return reinterpret_cast<char const *>(s); }

std::optional<std::string> attribute_value(xmlNode *node, std::string const &name) {
  xmlChar *value{ xmlGetProp(node, reinterpret_cast<xmlChar const *>(name.c_str())) };
  if (!value) { return std::nullopt; }
  std::string result{ as_chars(value) };
  xmlFree(value);
  return result;
}

bool names_equal_ignore_case(char const *a, std::string_view b) {
  std::string_view const sa{ a ? a : "" };
  if (sa.size() != b.size()) { return false; }
  for (std::size_t i{ 0 }; i < sa.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(sa[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

bool matches_compound(xmlNode *node, compound_selector const &sel) {
  if (node->type != XML_ELEMENT_NODE) { return false; }
  if (!sel.tag.empty() && !names_equal_ignore_case(as_chars(node->name), sel.tag)) {
    return false;
  }

  if (!sel.ids.empty()) {
    auto const id{ attribute_value(node, "id") };
    if (!id) { return false; }
    for (auto const &wanted : sel.ids) {
      if (*id != wanted) { return false; }
    }
  }

  if (!sel.classes.empty()) {
    auto const classes{ attribute_value(node, "class") };
    if (!classes) { return false; }
    for (auto const &wanted : sel.classes) {
      if (!css_class_list_contains(*classes, wanted)) { return false; }
    }
  }

  for (auto const &attr : sel.attributes) {
    auto const value{ attribute_value(node, attr.name) };
    if (!value || !css_attribute_value_matches(attr, *value)) { return false; }
  }

  return true;
}

bool matches_at(xmlNode *node, complex_selector const &sel, std::size_t index) {
  if (!matches_compound(node, sel.compounds[index])) { return false; }
  if (index == 0) { return true; }

  css_combinator const comb{ sel.combinators[index - 1] };
  for (xmlNode *parent{ node->parent }; parent && parent->type == XML_ELEMENT_NODE;
       parent = parent->parent) {
    if (matches_at(parent, sel, index - 1)) { return true; }
    if (comb == css_combinator::child) { return false; }
  }
  return false;
}

bool matches(xmlNode *node, css_selector const &selector) {
  for (auto const &alt : selector.alternatives) {
    if (!alt.compounds.empty() && matches_at(node, alt, alt.compounds.size() - 1)) {
      return true;
    }
  }
  return false;
}

template <typename Pred>
xmlNode *find_first(xmlNode *node, Pred const &pred) {
  for (; node; node = node->next) {
    if (node->type != XML_ELEMENT_NODE) { continue; }
    if (pred(node)) { return node; }
    if (xmlNode *found{ find_first(node->children, pred) }) { return found; }
  }
  return nullptr;
}

}  // namespace

void xml_doc_deleter::operator()(xmlDoc *doc) const noexcept {
  if (doc) { xmlFreeDoc(doc); }
}

html_document html_document::parse(std::string_view html) {
  auto doc{ read_html(html, 0) };
  if (!doc) { throw std::runtime_error("html_document: failed to parse document"); }
  return html_document{ std::move(doc) };
}

xmlNode *html_document::select_first(css_selector const &selector) const {
  return find_first(xmlDocGetRootElement(doc_.get()),
                    [&](xmlNode *node) { return matches(node, selector); });
}

void html_document::replace_children(xmlNode *node, std::string_view markup) {
  if (!node) { throw std::invalid_argument("html_document::replace_children: null node"); }

  std::string wrapper{ "<div id=\"" };
  wrapper.append(kWrapperId).append("\">").append(markup).append("</div>");

  auto const fragment{ read_html(wrapper, HTML_PARSE_NOIMPLIED) };
  if (!fragment) { throw std::runtime_error("html_document: failed to parse fragment markup"); }

  xmlNode *const wrapper_node{ find_first(xmlDocGetRootElement(fragment.get()),
                                          [](xmlNode *n) {
                                            auto const id{ attribute_value(n, "id") };
                                            return id && *id == kWrapperId;
                                          }) };
  if (!wrapper_node) { throw std::runtime_error("html_document: fragment wrapper lost"); }

  for (xmlNode *child{ node->children }; child;) {
    xmlNode *const next{ child->next };
    xmlUnlinkNode(child);
    xmlFreeNode(child);
    child = next;
  }

  for (xmlNode *child{ wrapper_node->children }; child; child = child->next) {
    xmlNode *const copy{ xmlDocCopyNode(child, node->doc, 1) };
    if (!copy) { throw std::runtime_error("html_document: failed to copy fragment node"); }
    if (!xmlAddChild(node, copy)) {
      xmlFreeNode(copy);
      throw std::runtime_error("html_document: failed to attach fragment node");
    }
  }
}

std::string html_document::serialize() const {
  xmlChar *buffer{ nullptr };
  int size{ 0 };
  htmlDocDumpMemoryFormat(doc_.get(), &buffer, &size, 0);
  if (!buffer) { throw std::runtime_error("html_document: serialization failed"); }

  std::string result{ as_chars(buffer), static_cast<std::size_t>(size) };
  xmlFree(buffer);
  return result;
}

}  // namespace mosaic
