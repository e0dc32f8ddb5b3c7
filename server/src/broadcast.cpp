/*
 * 설명: 이벤트를 한 번 직렬화한 뒤 각 연결에 독립적으로 전달한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/broadcast_test.cpp
 */
#include "gameroom/broadcast.hpp"

#include <exception>
#include <string>

namespace gameroom {

std::size_t BroadcastDispatcher::Deliver(const ServerEvent& event,
                                         const std::vector<std::weak_ptr<Connection>>& connections) const {
  const auto message = EncodeServerEvent(event);
  std::size_t delivered = 0;
  for (const auto& weak : connections) {
    auto connection = weak.lock();
    if (!connection) {
      continue;
    }
    try {
      connection->Send(message);
      ++delivered;
    } catch (const std::exception& ex) {
      if (observability_) {
        observability_->Log(LogContext{"", std::nullopt, "broadcast.send_failed", ex.what(), LogLevel::kWarn});
      }
      connection->Close();
    }
  }
  return delivered;
}

}  // namespace gameroom
