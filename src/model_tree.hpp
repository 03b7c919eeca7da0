#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace trm {

// YAML and TOML documents are converted to a JSON tree so that every format
// goes through the same schema reader. Both throw ParseError.
nlohmann::json YAMLToTree(const std::string& text);
nlohmann::json TOMLToTree(const std::string& text);

}  // namespace trm
