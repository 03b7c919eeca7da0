#pragma once

#include "trm/model.hpp"
#include <stdexcept>
#include <string>

namespace trm {

enum class Format { kJson, kYaml, kToml, kInferred };

// Malformed or unsupported model text
class ParseError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// "json", "yaml", "yml", "toml" in any case; anything else is kInferred.
Format FormatFromName(const std::string& name);
// Format named by the file extension of path
Format FormatFromPath(const std::string& path);

// Parse model text. kInferred looks at the first line that is not blank or a
// comment. Referential integrity is left to Machine construction.
Model ParseModel(const std::string& text, Format format = Format::kInferred);

// Read and parse a model file; kInferred looks at the extension first.
Model LoadModelFile(const std::string& path, Format format = Format::kInferred);

// Normalized JSON form of a model, accepted back by ParseModel. Throws
// std::invalid_argument if a symbol byte is 0x80 or above.
std::string ToJSON(const Model& model);

}  // namespace trm
