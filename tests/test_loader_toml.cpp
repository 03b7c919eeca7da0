#include <gtest/gtest.h>
#include "trm/loader.hpp"

namespace trm {
namespace {

TEST(LoaderTomlTest, ParseStates) {
  std::string source = R"(
[[states]]
name = "q0"
start = true
transitions = [
  { cons = "0", prod = "1", move = "R", next = "q1" },
  { cons = "*", prod = "*", move = "s", next = "q1" },
]

[[states]]
name = "q1"
final = true
)";

  Model model = ParseModel(source, Format::kToml);
  ASSERT_EQ(model.states.size(), 2);
  EXPECT_TRUE(model.states[0].is_start);
  ASSERT_EQ(model.states[0].transitions.size(), 2);
  EXPECT_EQ(model.states[0].transitions[0].read, '0');
  EXPECT_EQ(model.states[0].transitions[0].write, '1');
  EXPECT_EQ(model.states[0].transitions[0].move, Move::R);
  EXPECT_EQ(model.states[0].transitions[1].read, kWildcard);
  EXPECT_EQ(model.states[0].transitions[1].move, Move::S);
  EXPECT_TRUE(model.states[1].is_final);
}

TEST(LoaderTomlTest, ParseAliasesAndConfig) {
  std::string source = R"(
[config]
empty = "0"
some = "?"

[[state]]
name = "a"
is_start = true
is_final = true

[[state.trans]]
consume = "x"
produce = "y"
move = "l"
next = "a"
)";

  Model model = ParseModel(source, Format::kToml);
  EXPECT_EQ(model.blank, '0');
  EXPECT_EQ(model.wildcard, '?');
  ASSERT_EQ(model.states.size(), 1);
  EXPECT_TRUE(model.states[0].is_final);
  ASSERT_EQ(model.states[0].transitions.size(), 1);
  EXPECT_EQ(model.states[0].transitions[0].read, 'x');
  EXPECT_EQ(model.states[0].transitions[0].move, Move::L);
}

TEST(LoaderTomlTest, InferredFromText) {
  Model table = ParseModel("# flip\n[[states]]\nname = \"s\"\nstart = true\n");
  ASSERT_EQ(table.states.size(), 1);
  EXPECT_TRUE(table.states[0].is_start);

  Model inline_array = ParseModel("states = [ { name = \"s\", start = true } ]\n");
  ASSERT_EQ(inline_array.states.size(), 1);
}

TEST(LoaderTomlTest, RejectsMalformedTOML) {
  EXPECT_THROW(ParseModel("[[states]\nname = \"a\"\n", Format::kToml), ParseError);
  // Integers are not symbols
  EXPECT_THROW(ParseModel("[[states]]\nname = 1\n", Format::kToml), ParseError);
}

TEST(LoaderTomlTest, WildcardExampleMatchesJSON) {
  Model toml = LoadModelFile(std::string(EXAMPLES_DIR) + "/wildcard.toml");
  Model json = LoadModelFile(std::string(EXAMPLES_DIR) + "/wildcard.json");
  EXPECT_EQ(toml, json);
}

}  // namespace
}  // namespace trm
