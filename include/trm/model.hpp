#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace trm {

enum class Move { L, R, S };

using Symbol = char;
constexpr Symbol kBlank = '_';
constexpr Symbol kWildcard = '*';

char MoveToChar(Move m);
// Accepts 'L', 'R', 'S' in either case; returns false for anything else.
bool MoveFromChar(char c, Move* out);

struct Transition {
  Symbol read;
  Symbol write;
  Move move;
  std::string next;

  bool operator==(const Transition& other) const {
    return read == other.read && write == other.write &&
           move == other.move && next == other.next;
  }
};

struct State {
  std::string name;
  bool is_start = false;
  bool is_final = false;
  std::vector<Transition> transitions;  // declaration order is significant

  bool operator==(const State& other) const {
    return name == other.name && is_start == other.is_start &&
           is_final == other.is_final && transitions == other.transitions;
  }
};

struct Model {
  std::vector<State> states;
  Symbol blank = kBlank;
  Symbol wildcard = kWildcard;

  void AddState(const std::string& name, bool is_start = false, bool is_final = false);
  // Appends a transition to an existing state; creates the state if absent.
  void AddTransition(const std::string& from, Symbol read, Symbol write, Move move,
                     const std::string& to);

  const State* FindState(const std::string& name) const;

  bool Validate(std::string* error = nullptr) const;

  bool operator==(const Model& other) const {
    return states == other.states && blank == other.blank && wildcard == other.wildcard;
  }
};

class ValidationError : public std::runtime_error {
public:
  enum class Kind {
    kMissingStartState,
    kMultipleStartStates,
    kDuplicateStateName,
    kUnknownNextState,
    kInvalidSentinels,
  };

  ValidationError(Kind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  Kind kind() const { return kind_; }

private:
  Kind kind_;
};

// Throws ValidationError describing the first problem found.
void CheckModel(const Model& model);

}  // namespace trm
