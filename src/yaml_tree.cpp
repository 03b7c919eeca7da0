#include "model_tree.hpp"
#include "trm/loader.hpp"

#include <yaml-cpp/yaml.h>

namespace trm {

using nlohmann::json;

namespace {

// Quoted scalars are always strings. Plain true/false are booleans; every
// other plain scalar stays a string so that symbols like 0 or y keep their text.
json ScalarToTree(const YAML::Node& node) {
  const std::string& value = node.Scalar();
  if (node.Tag() != "!") {
    if (value == "true" || value == "True" || value == "TRUE") return true;
    if (value == "false" || value == "False" || value == "FALSE") return false;
  }
  return value;
}

json NodeToTree(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Map: {
      json obj = json::object();
      for (const auto& kv : node) {
        obj[kv.first.Scalar()] = NodeToTree(kv.second);
      }
      return obj;
    }
    case YAML::NodeType::Sequence: {
      json arr = json::array();
      for (const auto& item : node) {
        arr.push_back(NodeToTree(item));
      }
      return arr;
    }
    case YAML::NodeType::Scalar:
      return ScalarToTree(node);
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      break;
  }
  return nullptr;
}

}  // namespace

json YAMLToTree(const std::string& text) {
  try {
    return NodeToTree(YAML::Load(text));
  } catch (const YAML::Exception& e) {
    throw ParseError(std::string("Invalid YAML: ") + e.what());
  }
}

}  // namespace trm
