/*
 * 설명: 커넥트 포 착수 검증과 4목 판정을 비트보드로 처리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/connect_four_test.cpp
 */
#include "gameroom/connect_four.hpp"

namespace gameroom {
namespace {
// 열마다 8비트를 사용해 6행 위의 빈 비트가 열 사이 경계 역할을 한다.
constexpr int kBitsPerColumn = 8;
constexpr int kDirections[] = {1, kBitsPerColumn - 1, kBitsPerColumn, kBitsPerColumn + 1};
}  // namespace

std::uint64_t ConnectFour::CellBit(int column, int row) {
  return std::uint64_t{1} << (kBitsPerColumn * column + row);
}

bool ConnectFour::HasFourInRow(std::uint64_t stones) {
  for (int shift : kDirections) {
    const std::uint64_t pairs = stones & (stones >> shift);
    if ((pairs & (pairs >> (2 * shift))) != 0) {
      return true;
    }
  }
  return false;
}

MoveOutcome ConnectFour::Play(Role player, int column) {
  if (winner_) {
    return MoveOutcome{false, "Game is over.", 0};
  }
  if (player == Role::kSpectator) {
    return MoveOutcome{false, "Spectators cannot play.", 0};
  }
  if (player != NextPlayer()) {
    return MoveOutcome{false, "It isn't your turn.", 0};
  }
  if (column < 0 || column >= kColumns) {
    return MoveOutcome{false, "Illegal column.", 0};
  }
  const int row = heights_[column];
  if (row == kRows) {
    return MoveOutcome{false, "This slot is full.", 0};
  }

  auto& stones = stones_[player == Role::kPlayer1 ? 0 : 1];
  stones |= CellBit(column, row);
  ++heights_[column];
  ++move_count_;
  if (HasFourInRow(stones)) {
    winner_ = player;
  }
  return MoveOutcome{true, {}, row};
}

}  // namespace gameroom
