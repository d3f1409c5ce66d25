#pragma once

#include "css_selector.h"

#include <libxml/tree.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace mosaic {

struct xml_doc_deleter {
  void operator()(xmlDoc *doc) const noexcept;
};
using xml_doc_ptr_t = std::unique_ptr<xmlDoc, xml_doc_deleter>;

// A host document parsed once with the libxml2 HTML parser, mutated in place.
class html_document {
 public:
  // Never touches the network; parser diagnostics are suppressed. Throws
  // std::runtime_error when libxml2 produces no document.
  static html_document parse(std::string_view html);

  // First element in document order matching any alternative, or nullptr.
  xmlNode *select_first(css_selector const &selector) const;

  // Replaces node's children with the nodes parsed from markup.
  void replace_children(xmlNode *node, std::string_view markup);

  std::string serialize() const;

 private:
  explicit html_document(xml_doc_ptr_t doc) : doc_{ std::move(doc) } {}

  xml_doc_ptr_t doc_;
};

}  // namespace mosaic
