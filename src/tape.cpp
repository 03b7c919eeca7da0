#include "trm/tape.hpp"

namespace trm {

Tape::Tape(const std::string& input, Symbol blank)
    : cells_(input.begin(), input.end()), origin_(0), head_(0), blank_(blank) {
  if (cells_.empty()) {
    cells_.push_back(blank_);
  }
}

Symbol Tape::Read() const {
  return cells_[head_ - origin_];
}

void Tape::Write(Symbol s) {
  cells_[head_ - origin_] = s;
}

void Tape::MoveHead(Move dir) {
  switch (dir) {
    case Move::L:
      --head_;
      if (head_ < origin_) {
        cells_.push_front(blank_);
        --origin_;
      }
      break;
    case Move::R:
      ++head_;
      if (head_ - origin_ >= static_cast<std::int64_t>(cells_.size())) {
        cells_.push_back(blank_);
      }
      break;
    case Move::S:
      break;
  }
}

Symbol Tape::At(std::int64_t pos) const {
  std::int64_t idx = pos - origin_;
  if (idx < 0 || idx >= static_cast<std::int64_t>(cells_.size())) return blank_;
  return cells_[idx];
}

TapeSnapshot Tape::Snapshot() const {
  return {std::string(cells_.begin(), cells_.end()), head_ - origin_, origin_};
}

std::string Tape::Contents() const {
  std::int64_t left = 0, right = static_cast<std::int64_t>(cells_.size()) - 1;
  while (left < static_cast<std::int64_t>(cells_.size()) && cells_[left] == blank_) ++left;
  while (right >= 0 && cells_[right] == blank_) --right;
  if (left > right) return "";
  return std::string(cells_.begin() + left, cells_.begin() + right + 1);
}

}  // namespace trm
