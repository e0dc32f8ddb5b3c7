/*
 * 설명: 역할 이름 변환을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/event_codec_test.cpp
 */
#include "gameroom/game_engine.hpp"

namespace gameroom {

std::string_view RoleName(Role role) {
  switch (role) {
    case Role::kPlayer1:
      return "Player1";
    case Role::kPlayer2:
      return "Player2";
    case Role::kSpectator:
      return "Spectator";
  }
  return "Spectator";
}

}  // namespace gameroom
