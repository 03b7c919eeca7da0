#include <gtest/gtest.h>
#include "trm/tape.hpp"
#include <cstdint>
#include <type_traits>

namespace trm {
namespace {

TEST(TapeTest, InputIsSeededFromPositionZero) {
  Tape tape("0101");
  EXPECT_EQ(tape.Position(), 0);
  EXPECT_EQ(tape.Read(), '0');
  EXPECT_EQ(tape.At(1), '1');
  EXPECT_EQ(tape.At(3), '1');
  EXPECT_EQ(tape.At(4), kBlank);
  EXPECT_EQ(tape.At(-1), kBlank);
}

TEST(TapeTest, EmptyInputReadsBlank) {
  Tape tape("");
  EXPECT_EQ(tape.Read(), kBlank);

  auto snap = tape.Snapshot();
  EXPECT_EQ(snap.cells, "_");
  EXPECT_EQ(snap.head, 0);
  EXPECT_EQ(snap.left, 0);
}

TEST(TapeTest, WriteThenRead) {
  Tape tape("0101");
  tape.Write('1');
  EXPECT_EQ(tape.Read(), '1');

  // Same after wandering off in both directions
  for (int i = 0; i < 7; ++i) tape.MoveHead(Move::R);
  tape.Write('x');
  EXPECT_EQ(tape.Read(), 'x');
  for (int i = 0; i < 12; ++i) tape.MoveHead(Move::L);
  tape.Write('y');
  EXPECT_EQ(tape.Read(), 'y');
  EXPECT_EQ(tape.Position(), -5);
  EXPECT_EQ(tape.At(7), 'x');
}

TEST(TapeTest, MoveLeftFromZeroExtendsWithBlank) {
  Tape tape("ab");
  tape.MoveHead(Move::L);
  EXPECT_EQ(tape.Position(), -1);
  EXPECT_EQ(tape.Read(), kBlank);

  auto snap = tape.Snapshot();
  EXPECT_EQ(snap.cells, "_ab");
  EXPECT_EQ(snap.head, 0);
  EXPECT_EQ(snap.left, -1);
  EXPECT_EQ(snap.HeadPosition(), -1);
  EXPECT_EQ(snap.Right(), 2);
}

TEST(TapeTest, MoveRightPastEndExtendsWithBlank) {
  Tape tape("a");
  tape.MoveHead(Move::R);
  EXPECT_EQ(tape.Position(), 1);
  EXPECT_EQ(tape.Read(), kBlank);
  EXPECT_EQ(tape.Snapshot().cells, "a_");
}

TEST(TapeTest, StayKeepsHead) {
  Tape tape("ab");
  tape.MoveHead(Move::S);
  EXPECT_EQ(tape.Position(), 0);
  EXPECT_EQ(tape.Read(), 'a');
  EXPECT_EQ(tape.Snapshot().cells, "ab");
}

TEST(TapeTest, SnapshotHasNoPadding) {
  Tape tape("abc");
  tape.MoveHead(Move::R);
  tape.MoveHead(Move::L);
  auto snap = tape.Snapshot();
  EXPECT_EQ(snap.cells, "abc");
  EXPECT_EQ(snap.head, 0);
  EXPECT_EQ(snap.left, 0);
}

TEST(TapeTest, ContentsTrimsBlanks) {
  Tape tape("");
  tape.MoveHead(Move::L);
  tape.MoveHead(Move::L);
  tape.Write('1');
  tape.MoveHead(Move::R);
  tape.Write('0');
  EXPECT_EQ(tape.Snapshot().cells, "10_");
  EXPECT_EQ(tape.Contents(), "10");

  Tape blank("___");
  EXPECT_EQ(blank.Contents(), "");
}

TEST(TapeTest, PositionsBeyondThirtyTwoBits) {
  static_assert(std::is_same<decltype(TapeSnapshot::left), std::int64_t>::value, "");

  Tape tape("ab");
  EXPECT_EQ(tape.At(std::int64_t{5000000000}), kBlank);
  EXPECT_EQ(tape.At(-std::int64_t{5000000000}), kBlank);
  EXPECT_EQ(tape.At(1), 'b');
}

TEST(TapeTest, CustomBlank) {
  Tape tape("", '0');
  EXPECT_EQ(tape.Read(), '0');
  tape.MoveHead(Move::L);
  EXPECT_EQ(tape.Read(), '0');
  EXPECT_EQ(tape.At(100), '0');
  EXPECT_EQ(tape.blank(), '0');
}

}  // namespace
}  // namespace trm
