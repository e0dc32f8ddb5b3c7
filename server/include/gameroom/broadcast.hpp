/*
 * 설명: 하나의 서버 이벤트를 여러 연결에 독립적으로 전달한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/broadcast_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "gameroom/connection.hpp"
#include "gameroom/event_codec.hpp"
#include "gameroom/observability.hpp"

namespace gameroom {

class BroadcastDispatcher {
 public:
  explicit BroadcastDispatcher(std::shared_ptr<Observability> observability = nullptr)
      : observability_(std::move(observability)) {}

  // 전달에 성공한 연결 수를 반환한다. 실패한 연결에는 Close()를 요청하고 예외를 밖으로 내보내지 않는다.
  std::size_t Deliver(const ServerEvent& event, const std::vector<std::weak_ptr<Connection>>& connections) const;

 private:
  std::shared_ptr<Observability> observability_;
};

}  // namespace gameroom
