#include "trm/model.hpp"

#include <cctype>
#include <unordered_set>
#include <utility>

namespace trm {

namespace {

// Reports the first problem in the model; returns false if there is none.
bool FindProblem(const Model& model, ValidationError::Kind* kind, std::string* message) {
  if (model.blank == model.wildcard) {
    *kind = ValidationError::Kind::kInvalidSentinels;
    *message = "Blank and wildcard symbols must differ: '" + std::string(1, model.blank) + "'";
    return true;
  }

  std::unordered_set<std::string> names;
  const State* start = nullptr;
  for (const auto& state : model.states) {
    if (!names.insert(state.name).second) {
      *kind = ValidationError::Kind::kDuplicateStateName;
      *message = "Duplicate state name: " + state.name;
      return true;
    }
    if (state.is_start) {
      if (start) {
        *kind = ValidationError::Kind::kMultipleStartStates;
        *message = "Multiple start states: " + start->name + ", " + state.name;
        return true;
      }
      start = &state;
    }
  }

  if (!start) {
    *kind = ValidationError::Kind::kMissingStartState;
    *message = "No start state";
    return true;
  }

  for (const auto& state : model.states) {
    for (const auto& trans : state.transitions) {
      if (names.find(trans.next) == names.end()) {
        *kind = ValidationError::Kind::kUnknownNextState;
        *message = "Transition from " + state.name + " on '" + std::string(1, trans.read) +
                   "' targets unknown state: " + trans.next;
        return true;
      }
    }
  }

  return false;
}

}  // namespace

char MoveToChar(Move m) {
  switch (m) {
    case Move::L: return 'L';
    case Move::R: return 'R';
    case Move::S: return 'S';
  }
  return 'S';
}

bool MoveFromChar(char c, Move* out) {
  switch (std::toupper(static_cast<unsigned char>(c))) {
    case 'L': *out = Move::L; return true;
    case 'R': *out = Move::R; return true;
    case 'S': *out = Move::S; return true;
  }
  return false;
}

void Model::AddState(const std::string& name, bool is_start, bool is_final) {
  states.push_back({name, is_start, is_final, {}});
}

void Model::AddTransition(const std::string& from, Symbol read, Symbol write, Move move,
                          const std::string& to) {
  for (auto& state : states) {
    if (state.name == from) {
      state.transitions.push_back({read, write, move, to});
      return;
    }
  }
  State state{from, false, false, {}};
  state.transitions.push_back({read, write, move, to});
  states.push_back(std::move(state));
}

const State* Model::FindState(const std::string& name) const {
  for (const auto& state : states) {
    if (state.name == name) return &state;
  }
  return nullptr;
}

bool Model::Validate(std::string* error) const {
  ValidationError::Kind kind;
  std::string message;
  if (FindProblem(*this, &kind, &message)) {
    if (error) *error = message;
    return false;
  }
  return true;
}

void CheckModel(const Model& model) {
  ValidationError::Kind kind;
  std::string message;
  if (FindProblem(model, &kind, &message)) {
    throw ValidationError(kind, message);
  }
}

}  // namespace trm
