#include "pnn/extract/json_path.h"

namespace pnn::extract {

const nlohmann::json* lookup(const nlohmann::json* root,
                             const std::initializer_list<std::string_view> path) {
  const nlohmann::json* current = root;
  for (const std::string_view key : path) {
    if (current == nullptr || !current->is_object()) {
      return nullptr;
    }
    auto it = current->find(std::string(key));
    if (it == current->end() || it->is_null()) {
      return nullptr;
    }
    current = &*it;
  }
  return current;
}

std::optional<std::string> scalar(const nlohmann::json* node) {
  if (node == nullptr) {
    return std::nullopt;
  }
  if (node->is_string()) {
    return node->get<std::string>();
  }
  if (node->is_number() || node->is_boolean()) {
    return node->dump();
  }
  return std::nullopt;
}

std::optional<std::string> scalar_at(const nlohmann::json* root,
                                     const std::initializer_list<std::string_view> path) {
  return scalar(lookup(root, path));
}

const nlohmann::json& array_or_empty(const nlohmann::json* node) {
  static const nlohmann::json kEmptyArray = nlohmann::json::array();
  if (node == nullptr || !node->is_array()) {
    return kEmptyArray;
  }
  return *node;
}

const nlohmann::json& array_at(const nlohmann::json* root,
                               const std::initializer_list<std::string_view> path) {
  return array_or_empty(lookup(root, path));
}

const nlohmann::json* first_element(const nlohmann::json* node) {
  const nlohmann::json& array = array_or_empty(node);
  if (array.empty()) {
    return nullptr;
  }
  return &array.front();
}

bool array_contains(const nlohmann::json* node, const std::string_view value) {
  for (const auto& element : array_or_empty(node)) {
    if (element.is_string() && element.get_ref<const std::string&>() == value) {
      return true;
    }
  }
  return false;
}

}  // namespace pnn::extract
