#pragma once

#include <pugixml.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pnn::xml {

/// NUTS geography namespace used by notices published before the 2021 schema change
inline constexpr std::string_view kNuts2016Uri =
    "http://enotice.service.gov.uk/resource/schema/ted/2016/nuts";
/// NUTS geography namespace used from the 2021 schema change onwards
inline constexpr std::string_view kNuts2021Uri =
    "http://enotice.service.gov.uk/resource/schema/ted/2021/nuts";

/// Namespaces a TED-style notice is queried in
enum class Namespace {
  kTed,       // The document's own root namespace, discovered per document
  kNuts2016,  // kNuts2016Uri
  kNuts2021,  // kNuts2021Uri
};

/// NamespaceMap binds each Namespace to the prefix one document actually uses for it.
///
/// pugixml compares element names literally ("n2016:NUTS"), so lookups are written as path
/// templates whose namespace placeholders ({ted}, {n2016}, {n2021}) are expanded to the
/// document's prefixes. A namespace the document never declares stays unresolved and every
/// path that mentions it matches nothing.
class NamespaceMap {
 public:
  /// Resolve all namespaces for the document rooted at root.
  /// The TED namespace is the one bound to the root element's own prefix; the NUTS
  /// namespaces are found among the xmlns declarations anywhere in the document.
  [[nodiscard]] static NamespaceMap resolve(const pugi::xml_node& root);

  [[nodiscard]] std::optional<std::string> uri(Namespace ns) const;

  /// Prefix bound to ns; "" when ns is the default namespace of the elements concerned
  [[nodiscard]] std::optional<std::string> prefix(Namespace ns) const;

  [[nodiscard]] bool is_resolved(Namespace ns) const { return prefix(ns).has_value(); }

  /// Expand a path template into an XPath expression.
  /// std::nullopt when the template mentions an unresolved namespace.
  [[nodiscard]] std::optional<std::string> expand(std::string_view path_template) const;

 private:
  struct Binding {
    std::optional<std::string> uri;
    std::optional<std::string> prefix;
  };

  [[nodiscard]] const Binding& binding(Namespace ns) const;

  std::array<Binding, 3> bindings_;
};

/// First node matching the path template below context, or an empty node
[[nodiscard]] pugi::xml_node select_first(const pugi::xml_node& context, const NamespaceMap& ns,
                                          std::string_view path_template);

/// All nodes matching the path template below context, in document order
[[nodiscard]] std::vector<pugi::xml_node> select_all(const pugi::xml_node& context,
                                                     const NamespaceMap& ns,
                                                     std::string_view path_template);

}  // namespace pnn::xml
