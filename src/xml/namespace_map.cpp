#include "pnn/xml/namespace_map.h"

#include <cstring>

namespace pnn::xml {

namespace {

constexpr std::size_t index_of(const Namespace ns) {
  return static_cast<std::size_t>(ns);
}

// Prefix part of a qualified element name ("ted:TED_EXPORT" → "ted", "TED_EXPORT" → "")
std::string prefix_of(const char* qualified_name) {
  const char* colon = std::strchr(qualified_name, ':');
  if (colon == nullptr) {
    return {};
  }
  return std::string(qualified_name, colon);
}

// Prefix declared by an xmlns attribute ("xmlns:n2016" → "n2016", "xmlns" → ""),
// std::nullopt for ordinary attributes
std::optional<std::string> declared_prefix(const pugi::xml_attribute& attr) {
  const std::string_view name = attr.name();
  if (name == "xmlns") {
    return std::string{};
  }
  constexpr std::string_view kXmlnsColon = "xmlns:";
  if (name.starts_with(kXmlnsColon)) {
    return std::string(name.substr(kXmlnsColon.size()));
  }
  return std::nullopt;
}

// Prefix node itself declares for uri, if any
std::optional<std::string> declared_for(const pugi::xml_node& node, const std::string_view uri) {
  for (const pugi::xml_attribute& attr : node.attributes()) {
    auto prefix = declared_prefix(attr);
    if (prefix.has_value() && uri == attr.value()) {
      return prefix;
    }
  }
  return std::nullopt;
}

// First prefix declared for uri at or below root, in document order. find_node walks the
// tree without recursion, so nesting depth is unbounded.
std::optional<std::string> find_declaration(const pugi::xml_node& root,
                                            const std::string_view uri) {
  std::optional<std::string> found = declared_for(root, uri);
  if (!found.has_value()) {
    root.find_node([&found, uri](const pugi::xml_node& n) {
      found = declared_for(n, uri);
      return found.has_value();
    });
  }
  return found;
}

std::optional<Namespace> token_to_namespace(const std::string_view token) {
  if (token == "ted") {
    return Namespace::kTed;
  }
  if (token == "n2016") {
    return Namespace::kNuts2016;
  }
  if (token == "n2021") {
    return Namespace::kNuts2021;
  }
  return std::nullopt;
}

}  // namespace

NamespaceMap NamespaceMap::resolve(const pugi::xml_node& root) {
  NamespaceMap map;
  if (!root) {
    return map;
  }

  // Root namespace: the URI bound to the root element's own prefix on the root itself
  const std::string root_prefix = prefix_of(root.name());
  const std::string declaration = root_prefix.empty() ? "xmlns" : "xmlns:" + root_prefix;
  const pugi::xml_attribute root_ns = root.attribute(declaration.c_str());
  if (root_ns && root_ns.value()[0] != '\0') {
    Binding& ted = map.bindings_[index_of(Namespace::kTed)];
    ted.uri = root_ns.value();
    ted.prefix = root_prefix;
  }

  const std::array<std::pair<Namespace, std::string_view>, 2> nuts{{
      {Namespace::kNuts2016, kNuts2016Uri},
      {Namespace::kNuts2021, kNuts2021Uri},
  }};
  for (const auto& [ns, nuts_uri] : nuts) {
    std::optional<std::string> found = find_declaration(root, nuts_uri);
    if (found.has_value()) {
      Binding& binding = map.bindings_[index_of(ns)];
      binding.uri = std::string(nuts_uri);
      binding.prefix = std::move(found);
    }
  }

  return map;
}

std::optional<std::string> NamespaceMap::uri(const Namespace ns) const {
  return binding(ns).uri;
}

std::optional<std::string> NamespaceMap::prefix(const Namespace ns) const {
  return binding(ns).prefix;
}

const NamespaceMap::Binding& NamespaceMap::binding(const Namespace ns) const {
  return bindings_[index_of(ns)];
}

std::optional<std::string> NamespaceMap::expand(const std::string_view path_template) const {
  std::string expanded;
  expanded.reserve(path_template.size());

  std::size_t pos = 0;
  while (pos < path_template.size()) {
    const std::size_t open = path_template.find('{', pos);
    if (open == std::string_view::npos) {
      expanded.append(path_template.substr(pos));
      break;
    }
    const std::size_t close = path_template.find('}', open);
    if (close == std::string_view::npos) {
      return std::nullopt;
    }

    expanded.append(path_template.substr(pos, open - pos));

    const auto ns = token_to_namespace(path_template.substr(open + 1, close - open - 1));
    if (!ns.has_value()) {
      return std::nullopt;
    }
    const auto ns_prefix = prefix(ns.value());
    if (!ns_prefix.has_value()) {
      return std::nullopt;
    }
    if (!ns_prefix->empty()) {
      expanded += ns_prefix.value();
      expanded += ':';
    }

    pos = close + 1;
  }

  return expanded;
}

pugi::xml_node select_first(const pugi::xml_node& context, const NamespaceMap& ns,
                            const std::string_view path_template) {
  if (!context) {
    return {};
  }
  const auto expression = ns.expand(path_template);
  if (!expression.has_value()) {
    return {};
  }
  return context.select_node(expression->c_str()).node();
}

std::vector<pugi::xml_node> select_all(const pugi::xml_node& context, const NamespaceMap& ns,
                                       const std::string_view path_template) {
  std::vector<pugi::xml_node> nodes;
  if (!context) {
    return nodes;
  }
  const auto expression = ns.expand(path_template);
  if (!expression.has_value()) {
    return nodes;
  }

  pugi::xpath_node_set matches = context.select_nodes(expression->c_str());
  matches.sort();
  nodes.reserve(matches.size());
  for (const pugi::xpath_node& match : matches) {
    if (match.node()) {
      nodes.push_back(match.node());
    }
  }
  return nodes;
}

}  // namespace pnn::xml
