/*
 * 설명: 기본 게임 엔진인 커넥트 포(7열 x 6행) 규칙을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/connect_four_test.cpp
 */
#pragma once

#include <array>
#include <cstdint>
#include <optional>

#include "gameroom/game_engine.hpp"

namespace gameroom {

class ConnectFour : public GameEngine {
 public:
  static constexpr int kColumns = 7;
  static constexpr int kRows = 6;

  MoveOutcome Play(Role player, int column) override;
  std::optional<Role> Winner() const override { return winner_; }

  int MoveCount() const { return move_count_; }
  Role NextPlayer() const { return move_count_ % 2 == 0 ? Role::kPlayer1 : Role::kPlayer2; }

 private:
  static std::uint64_t CellBit(int column, int row);
  static bool HasFourInRow(std::uint64_t stones);

  std::array<int, kColumns> heights_{};
  std::array<std::uint64_t, 2> stones_{};
  int move_count_{0};
  std::optional<Role> winner_;
};

}  // namespace gameroom
