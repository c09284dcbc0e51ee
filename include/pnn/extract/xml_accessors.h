#pragma once

#include <pugixml.hpp>

#include <optional>
#include <string>

namespace pnn::extract {

/// Trimmed text of a node's first text child.
/// std::nullopt when the node is empty (absent) or the trimmed text is blank.
[[nodiscard]] std::optional<std::string> text(const pugi::xml_node& node);

/// Named attribute of a node, or std::nullopt when the node or the attribute is absent.
[[nodiscard]] std::optional<std::string> attribute(const pugi::xml_node& node, const char* name);

/// text() of the first direct child with the given name
[[nodiscard]] std::optional<std::string> child_text(const pugi::xml_node& node,
                                                    const char* child_name);

}  // namespace pnn::extract
