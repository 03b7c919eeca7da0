#include <gtest/gtest.h>
#include "trm/machine.hpp"
#include "trm/report.hpp"

namespace trm {
namespace {

TEST(ReportTest, FormatIdentifier) {
  Identifier id{"q1", {"_ab", 0, -1}, 3, Status::kRunning};

  std::string text = FormatIdentifier(id);

  EXPECT_EQ(text,
            "State: q1\n"
            "Tape: _ab\n"
            "Head: -1\n"
            "Range (-1..2)\n");
}

TEST(ReportTest, FormatStep) {
  StepRecord record{4, "scan", 'a', 'X', Move::R, "back"};
  EXPECT_EQ(FormatStep(record), "4: scan a -> X R back");
}

TEST(ReportTest, FormatResult) {
  EXPECT_EQ(FormatResult({Status::kHaltedFinal, 7}), "Result: ACCEPT\nSteps: 7\n");
  EXPECT_EQ(FormatResult({Status::kHaltedStuck, 1}), "Result: REJECT\nSteps: 1\n");
  EXPECT_EQ(FormatResult({Status::kHaltedStepLimit, 0}), "Result: STEP LIMIT\nSteps: 0\n");
}

TEST(ReportTest, FormatMachineTrace) {
  Model model;
  model.AddState("A", true);
  model.AddState("B");
  model.AddTransition("A", 'b', kBlank, Move::L, "B");
  Machine machine(model);
  machine.Input("b");

  std::vector<StepRecord> trace;
  machine.Run(std::nullopt, &trace);

  ASSERT_EQ(trace.size(), 1);
  EXPECT_EQ(FormatStep(trace[0]), "1: A b -> _ L B");
  EXPECT_NE(FormatIdentifier(machine.CurrentIdentifier()).find("Head: -1"), std::string::npos);
}

}  // namespace
}  // namespace trm
