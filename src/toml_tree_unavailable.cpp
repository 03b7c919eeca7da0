#include "model_tree.hpp"
#include "trm/loader.hpp"

namespace trm {

// Built when toml++ is not found
nlohmann::json TOMLToTree(const std::string&) {
  throw ParseError("unsupported model format: toml (built without toml++)");
}

}  // namespace trm
