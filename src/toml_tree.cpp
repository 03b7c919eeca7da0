#include "model_tree.hpp"
#include "trm/loader.hpp"

#include <toml++/toml.hpp>

namespace trm {

using nlohmann::json;

namespace {

json NodeToTree(const toml::node& node) {
  if (const auto* table = node.as_table()) {
    json obj = json::object();
    for (auto&& [key, value] : *table) {
      obj[std::string(key.str())] = NodeToTree(value);
    }
    return obj;
  }
  if (const auto* array = node.as_array()) {
    json arr = json::array();
    for (const auto& element : *array) {
      arr.push_back(NodeToTree(element));
    }
    return arr;
  }
  if (const auto* s = node.as_string()) return s->get();
  if (const auto* b = node.as_boolean()) return b->get();
  if (const auto* i = node.as_integer()) return i->get();
  if (const auto* f = node.as_floating_point()) return f->get();
  // Dates and times
  return nullptr;
}

}  // namespace

json TOMLToTree(const std::string& text) {
  try {
    toml::table root = toml::parse(text);
    return NodeToTree(root);
  } catch (const toml::parse_error& e) {
    throw ParseError("Invalid TOML: " + std::string(e.description()));
  }
}

}  // namespace trm
