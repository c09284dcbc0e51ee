#include "pnn/extract/xml_accessors.h"

#include "pnn/core/normalization.h"

namespace pnn::extract {

std::optional<std::string> text(const pugi::xml_node& node) {
  if (!node) {
    return std::nullopt;
  }
  // child_value() is the first PCDATA/CDATA child, "" when there is none
  std::string value = core::trim(node.child_value());
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::string> attribute(const pugi::xml_node& node, const char* name) {
  if (!node) {
    return std::nullopt;
  }
  const pugi::xml_attribute attr = node.attribute(name);
  if (!attr) {
    return std::nullopt;
  }
  return std::string(attr.value());
}

std::optional<std::string> child_text(const pugi::xml_node& node, const char* child_name) {
  if (!node) {
    return std::nullopt;
  }
  return text(node.child(child_name));
}

}  // namespace pnn::extract
