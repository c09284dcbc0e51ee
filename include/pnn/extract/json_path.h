#pragma once

#include <nlohmann/json.hpp>

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace pnn::extract {

// Optional chaining over parsed JSON.
//
// Every helper accepts a possibly-null starting node and descends object keys one link at a
// time. The walk stops with nullptr as soon as a link is missing, null, or not an object, so
// a lookup is never attempted on an absent parent.

/// Node at the end of the key path, or nullptr if any link is absent
[[nodiscard]] const nlohmann::json* lookup(const nlohmann::json* root,
                                           std::initializer_list<std::string_view> path);

[[nodiscard]] inline const nlohmann::json* lookup(const nlohmann::json& root,
                                                  std::initializer_list<std::string_view> path) {
  return lookup(&root, path);
}

/// Scalar rendered as a string: strings verbatim, numbers and booleans in JSON lexical form.
/// std::nullopt for absent, null, object and array nodes.
[[nodiscard]] std::optional<std::string> scalar(const nlohmann::json* node);

/// scalar(lookup(root, path))
[[nodiscard]] std::optional<std::string> scalar_at(const nlohmann::json* root,
                                                   std::initializer_list<std::string_view> path);

/// The node itself when it is an array, otherwise a shared empty array
[[nodiscard]] const nlohmann::json& array_or_empty(const nlohmann::json* node);

/// array_or_empty(lookup(root, path))
[[nodiscard]] const nlohmann::json& array_at(const nlohmann::json* root,
                                             std::initializer_list<std::string_view> path);

/// First element of an array node, or nullptr when absent, empty or not an array
[[nodiscard]] const nlohmann::json* first_element(const nlohmann::json* node);

/// Whether an array node contains the given string value
[[nodiscard]] bool array_contains(const nlohmann::json* node, std::string_view value);

}  // namespace pnn::extract
