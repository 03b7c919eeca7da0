#include "trm/report.hpp"
#include <sstream>

namespace trm {

namespace {

const char* Outcome(Status status) {
  switch (status) {
    case Status::kHaltedFinal: return "ACCEPT";
    case Status::kHaltedStuck: return "REJECT";
    case Status::kHaltedStepLimit: return "STEP LIMIT";
    case Status::kReady:
    case Status::kRunning:
      break;
  }
  return "RUNNING";
}

}  // namespace

std::string FormatIdentifier(const Identifier& id) {
  std::ostringstream out;
  out << "State: " << id.current_state << "\n";
  out << "Tape: " << id.tape.cells << "\n";
  out << "Head: " << id.tape.HeadPosition() << "\n";
  out << "Range (" << id.tape.left << ".." << id.tape.Right() << ")\n";
  return out.str();
}

std::string FormatStep(const StepRecord& record) {
  std::ostringstream out;
  out << record.step << ": " << record.from << " " << record.read << " -> "
      << record.write << " " << MoveToChar(record.move) << " " << record.to;
  return out.str();
}

std::string FormatResult(const RunResult& result) {
  std::ostringstream out;
  out << "Result: " << Outcome(result.status) << "\n";
  out << "Steps: " << result.steps << "\n";
  return out.str();
}

}  // namespace trm
