#include "trm/loader.hpp"
#include "model_tree.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace trm {

using nlohmann::json;

namespace {

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Looks up key, falling back to its alias. Returns nullptr if neither is present.
const json* Member(const json& obj, const char* key, const char* alias) {
  auto it = obj.find(key);
  if (it == obj.end()) it = obj.find(alias);
  if (it == obj.end()) return nullptr;
  return &*it;
}

bool OptionalBool(const json& obj, const char* key, const char* alias, const std::string& where) {
  const json* v = Member(obj, key, alias);
  if (!v) return false;
  if (!v->is_boolean()) {
    throw ParseError(where + ": '" + key + "' must be a boolean");
  }
  return v->get<bool>();
}

std::string RequiredString(const json& obj, const char* key, const char* alias,
                           const std::string& where) {
  const json* v = Member(obj, key, alias);
  if (!v) {
    throw ParseError(where + ": missing '" + key + "'");
  }
  if (!v->is_string()) {
    throw ParseError(where + ": '" + key + "' must be a string");
  }
  return v->get<std::string>();
}

Symbol RequiredSymbol(const json& obj, const char* key, const char* alias,
                      const std::string& where) {
  std::string s = RequiredString(obj, key, alias, where);
  if (s.size() != 1) {
    throw ParseError(where + ": '" + key + "' must be a single character, got \"" + s + "\"");
  }
  return s[0];
}

Transition ParseTransition(const json& j, const std::string& where) {
  if (!j.is_object()) {
    throw ParseError(where + ": transition must be an object");
  }

  Transition trans;
  trans.read = RequiredSymbol(j, "cons", "consume", where);
  trans.write = RequiredSymbol(j, "prod", "produce", where);

  std::string move = RequiredString(j, "move", "move", where);
  if (move.size() != 1 || !MoveFromChar(move[0], &trans.move)) {
    throw ParseError(where + ": unknown move \"" + move + "\" (expected L, R or S)");
  }

  trans.next = RequiredString(j, "next", "next", where);
  return trans;
}

State ParseState(const json& j, size_t index) {
  std::string where = "state #" + std::to_string(index);
  if (!j.is_object()) {
    throw ParseError(where + ": state must be an object");
  }

  State state;
  state.name = RequiredString(j, "name", "name", where);
  where = "state '" + state.name + "'";
  state.is_start = OptionalBool(j, "start", "is_start", where);
  state.is_final = OptionalBool(j, "final", "is_final", where);

  const json* trans = Member(j, "transitions", "trans");
  if (trans) {
    if (!trans->is_array()) {
      throw ParseError(where + ": 'transitions' must be an array");
    }
    for (size_t i = 0; i < trans->size(); ++i) {
      state.transitions.push_back(
          ParseTransition((*trans)[i], where + " transition #" + std::to_string(i)));
    }
  }
  return state;
}

json JSONToTree(const std::string& text) {
  try {
    return json::parse(text);
  } catch (const json::parse_error& e) {
    throw ParseError(std::string("Invalid JSON: ") + e.what());
  }
}

Model ParseTree(const json& root) {
  if (!root.is_object()) {
    throw ParseError("Model must be a mapping of 'states' and 'config'");
  }

  Model model;

  const json* config = Member(root, "config", "config");
  if (config) {
    if (!config->is_object()) {
      throw ParseError("'config' must be an object");
    }
    if (Member(*config, "blank", "empty")) {
      model.blank = RequiredSymbol(*config, "blank", "empty", "config");
    }
    if (Member(*config, "wildcard", "some")) {
      model.wildcard = RequiredSymbol(*config, "wildcard", "some", "config");
    }
  }

  const json* states = Member(root, "states", "state");
  if (states) {
    if (!states->is_array()) {
      throw ParseError("'states' must be an array");
    }
    for (size_t i = 0; i < states->size(); ++i) {
      model.states.push_back(ParseState((*states)[i], i));
    }
  }

  return model;
}

Format InferFormat(const std::string& text) {
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    auto begin = std::find_if(line.begin(), line.end(),
                              [](unsigned char c) { return !std::isspace(c); });
    if (begin == line.end() || *begin == '#') continue;

    if (*begin == '{') return Format::kJson;
    if (*begin == '[') return Format::kToml;
    // TOML assigns with '=', YAML maps with ':'
    size_t eq = line.find('=');
    size_t colon = line.find(':');
    if (eq != std::string::npos && (colon == std::string::npos || eq < colon)) {
      return Format::kToml;
    }
    return Format::kYaml;
  }
  throw ParseError("Cannot infer model format of empty text");
}

}  // namespace

Format FormatFromName(const std::string& name) {
  std::string n = Lower(name);
  if (n == "json") return Format::kJson;
  if (n == "yaml" || n == "yml") return Format::kYaml;
  if (n == "toml") return Format::kToml;
  return Format::kInferred;
}

Format FormatFromPath(const std::string& path) {
  size_t slash = path.find_last_of("/\\");
  size_t dot = path.find_last_of('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
    return Format::kInferred;
  }
  return FormatFromName(path.substr(dot + 1));
}

Model ParseModel(const std::string& text, Format format) {
  if (format == Format::kInferred) {
    format = InferFormat(text);
  }

  switch (format) {
    case Format::kJson:
      return ParseTree(JSONToTree(text));
    case Format::kYaml:
      return ParseTree(YAMLToTree(text));
    case Format::kToml:
      return ParseTree(TOMLToTree(text));
    case Format::kInferred:
      break;
  }
  throw ParseError("Cannot infer model format");
}

Model LoadModelFile(const std::string& path, Format format) {
  std::ifstream ifs(path);
  if (!ifs) {
    throw ParseError("Cannot open model file: " + path);
  }
  std::stringstream buffer;
  buffer << ifs.rdbuf();

  if (format == Format::kInferred) {
    format = FormatFromPath(path);
  }
  return ParseModel(buffer.str(), format);
}

std::string ToJSON(const Model& model) {
  auto check = [](Symbol s) {
    if (static_cast<unsigned char>(s) >= 0x80) {
      throw std::invalid_argument("Symbol byte " +
                                  std::to_string(static_cast<unsigned char>(s)) +
                                  " has no single-character JSON form");
    }
  };
  check(model.blank);
  check(model.wildcard);
  for (const auto& state : model.states) {
    for (const auto& trans : state.transitions) {
      check(trans.read);
      check(trans.write);
    }
  }

  json root = json::object();

  if (model.blank != kBlank || model.wildcard != kWildcard) {
    root["config"] = {
        {"blank", std::string(1, model.blank)},
        {"wildcard", std::string(1, model.wildcard)},
    };
  }

  json states = json::array();
  for (const auto& state : model.states) {
    json transitions = json::array();
    for (const auto& trans : state.transitions) {
      transitions.push_back({
          {"cons", std::string(1, trans.read)},
          {"prod", std::string(1, trans.write)},
          {"move", std::string(1, MoveToChar(trans.move))},
          {"next", trans.next},
      });
    }
    states.push_back({
        {"name", state.name},
        {"start", state.is_start},
        {"final", state.is_final},
        {"transitions", transitions},
    });
  }
  root["states"] = states;

  return root.dump(2) + "\n";
}

}  // namespace trm
