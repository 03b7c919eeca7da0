#pragma once

#include "trm/model.hpp"
#include <cstdint>
#include <deque>
#include <string>

namespace trm {

// Read-only copy of the materialized tape window
struct TapeSnapshot {
  std::string cells;  // leftmost to rightmost materialized cell
  std::int64_t head;  // offset of the head within cells
  std::int64_t left;  // logical position of cells[0]

  std::int64_t HeadPosition() const { return left + head; }
  std::int64_t Right() const { return left + static_cast<std::int64_t>(cells.size()); }  // exclusive
};

// Tape unbounded in both directions. Only the cells that were written or
// visited by the head are stored; everything else reads as blank. The cell
// under the head is always materialized.
class Tape {
public:
  explicit Tape(const std::string& input = "", Symbol blank = kBlank);

  Symbol Read() const;
  void Write(Symbol s);
  void MoveHead(Move dir);

  std::int64_t Position() const { return head_; }
  Symbol At(std::int64_t pos) const;
  Symbol blank() const { return blank_; }

  TapeSnapshot Snapshot() const;
  // Materialized cells with leading and trailing blanks trimmed
  std::string Contents() const;

private:
  std::deque<Symbol> cells_;
  std::int64_t origin_;  // logical position of cells_[0]
  std::int64_t head_;
  Symbol blank_;
};

}  // namespace trm
