#pragma once

#include "trm/model.hpp"
#include "trm/tape.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace trm {

// Execution status of a Machine (not of the simulated machine's states)
enum class Status {
  kReady,
  kRunning,
  kHaltedFinal,      // no transition, current state final: accept
  kHaltedStuck,      // no transition, current state not final: reject
  kHaltedStepLimit,  // step limit reached: inconclusive
};

const char* StatusName(Status status);
bool IsHalted(Status status);

// One executed transition
struct StepRecord {
  std::int64_t step;  // 1-based
  std::string from;
  Symbol read;
  Symbol write;
  Move move;
  std::string to;
};

struct RunResult {
  Status status;
  std::int64_t steps;

  bool accepted() const { return status == Status::kHaltedFinal; }
  bool hit_limit() const { return status == Status::kHaltedStepLimit; }
};

// Configuration of the machine at a point in time
struct Identifier {
  std::string current_state;
  TapeSnapshot tape;
  std::int64_t steps;
  Status status;
};

// Exact match first, then the first wildcard transition, both in declaration
// order. Returns nullptr if neither exists.
const Transition* FindTransition(const State& state, Symbol consumed, Symbol wildcard = kWildcard);

class Machine {
public:
  // Throws ValidationError if the model is invalid.
  explicit Machine(Model model);

  // Start state, single blank cell, zero steps
  void Reset();
  void Input(const std::string& input);

  // Executes one transition. Returns nullopt when no transition applies (the
  // machine halts) or when it had already halted; a halted machine is left
  // untouched.
  std::optional<StepRecord> Step();

  // Steps until halted or until steps() reaches step_limit. At the limit the
  // machine still halts final or stuck when no transition applies; otherwise
  // it halts with kHaltedStepLimit. Executed steps are appended to *trace
  // when trace is non-null.
  RunResult Run(std::optional<std::int64_t> step_limit = std::nullopt,
                std::vector<StepRecord>* trace = nullptr);

  Identifier CurrentIdentifier() const;

  Status status() const { return status_; }
  std::int64_t steps() const { return steps_; }
  const std::string& current_state() const { return model_.states[current_].name; }
  bool Halted() const { return IsHalted(status_); }
  bool Accepted() const { return status_ == Status::kHaltedFinal; }
  bool IsFinal() const { return model_.states[current_].is_final; }
  const Tape& tape() const { return tape_; }
  const Model& model() const { return model_; }

private:
  Model model_;
  std::unordered_map<std::string, size_t> index_;  // state name -> position in model_.states
  size_t start_;

  Tape tape_;
  size_t current_;
  std::int64_t steps_;
  Status status_;
};

}  // namespace trm
