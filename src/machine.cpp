#include "trm/machine.hpp"
#include <stdexcept>
#include <utility>

namespace trm {

const char* StatusName(Status status) {
  switch (status) {
    case Status::kReady: return "ready";
    case Status::kRunning: return "running";
    case Status::kHaltedFinal: return "halted-final";
    case Status::kHaltedStuck: return "halted-stuck";
    case Status::kHaltedStepLimit: return "halted-step-limit";
  }
  return "unknown";
}

bool IsHalted(Status status) {
  return status == Status::kHaltedFinal || status == Status::kHaltedStuck ||
         status == Status::kHaltedStepLimit;
}

const Transition* FindTransition(const State& state, Symbol consumed, Symbol wildcard) {
  // Try exact match first
  for (const auto& trans : state.transitions) {
    if (trans.read == consumed) return &trans;
  }
  // Then wildcard
  for (const auto& trans : state.transitions) {
    if (trans.read == wildcard) return &trans;
  }
  return nullptr;
}

Machine::Machine(Model model)
    : model_(std::move(model)),
      start_(0),
      tape_("", model_.blank),
      current_(0),
      steps_(0),
      status_(Status::kReady) {
  CheckModel(model_);

  for (size_t i = 0; i < model_.states.size(); ++i) {
    index_[model_.states[i].name] = i;
    if (model_.states[i].is_start) start_ = i;
  }

  Reset();
}

void Machine::Reset() {
  Input("");
}

void Machine::Input(const std::string& input) {
  tape_ = Tape(input, model_.blank);
  current_ = start_;
  steps_ = 0;
  status_ = Status::kReady;
}

std::optional<StepRecord> Machine::Step() {
  if (Halted()) return std::nullopt;

  const State& state = model_.states[current_];
  Symbol current = tape_.Read();

  const Transition* trans = FindTransition(state, current, model_.wildcard);
  if (!trans) {
    // Being in a final state with nowhere to go is a successful halt
    status_ = state.is_final ? Status::kHaltedFinal : Status::kHaltedStuck;
    return std::nullopt;
  }

  // The produced symbol is written as is, including a produced wildcard
  tape_.Write(trans->write);
  tape_.MoveHead(trans->move);

  current_ = index_.at(trans->next);
  ++steps_;
  status_ = Status::kRunning;

  return StepRecord{steps_, state.name, current, trans->write, trans->move, trans->next};
}

RunResult Machine::Run(std::optional<std::int64_t> step_limit, std::vector<StepRecord>* trace) {
  if (step_limit && *step_limit < 0) {
    throw std::invalid_argument("Step limit must not be negative: " +
                                std::to_string(*step_limit));
  }

  while (!Halted()) {
    if (step_limit && steps_ >= *step_limit) {
      // A machine with nowhere to go halts on its own even at the limit
      const State& state = model_.states[current_];
      if (FindTransition(state, tape_.Read(), model_.wildcard)) {
        status_ = Status::kHaltedStepLimit;
      } else {
        status_ = state.is_final ? Status::kHaltedFinal : Status::kHaltedStuck;
      }
      break;
    }
    auto record = Step();
    if (record && trace) {
      trace->push_back(*record);
    }
  }

  return {status_, steps_};
}

Identifier Machine::CurrentIdentifier() const {
  return {current_state(), tape_.Snapshot(), steps_, status_};
}

}  // namespace trm
