#pragma once

#include "trm/machine.hpp"
#include <string>

namespace trm {

// State, tape window, head position and window range, one per line
std::string FormatIdentifier(const Identifier& id);

// "<step>: <from> <read> -> <write> <move> <to>"
std::string FormatStep(const StepRecord& record);

// Outcome and step count, one per line
std::string FormatResult(const RunResult& result);

}  // namespace trm
