/*
 * 설명: 세션이 소유하는 게임 엔진의 계약(역할, 수 적용 결과, 승자 조회)을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/connect_four_test.cpp, server/tests/unit/session_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace gameroom {

enum class Role { kPlayer1, kPlayer2, kSpectator };

std::string_view RoleName(Role role);

struct MoveOutcome {
  bool accepted{false};
  std::string reason;
  int row{0};
};

// 규칙 위반은 accepted=false로 보고하고, 내부 오류만 예외로 던진다.
class GameEngine {
 public:
  virtual ~GameEngine() = default;

  virtual MoveOutcome Play(Role player, int column) = 0;
  virtual std::optional<Role> Winner() const = 0;
};

using GameEngineFactory = std::function<std::unique_ptr<GameEngine>()>;

}  // namespace gameroom
