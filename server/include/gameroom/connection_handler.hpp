/*
 * 설명: 연결 하나의 상태(Init -> Active -> Closed)를 관리하며 와이어 이벤트를 세션 연산으로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/connection_handler_test.cpp, server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "gameroom/connection.hpp"
#include "gameroom/event_codec.hpp"
#include "gameroom/observability.hpp"
#include "gameroom/session.hpp"
#include "gameroom/session_registry.hpp"

namespace gameroom {

enum class HandlerState { kInit, kActive, kClosed };

// 한 연결의 strand에서만 호출된다.
class ConnectionHandler {
 public:
  ConnectionHandler(std::weak_ptr<Connection> connection, std::shared_ptr<SessionRegistry> registry,
                    std::shared_ptr<Observability> observability, std::string trace_id);
  ~ConnectionHandler();

  void OnMessage(std::string_view raw);
  // 전송 계층이 닫혔을 때 호출한다. 여러 번 호출해도 안전하다.
  void OnClosed();

  HandlerState State() const { return state_; }
  std::optional<Role> CurrentRole() const;
  std::optional<std::string> SessionId() const;

 private:
  void HandleInit(const ClientEvent& event);
  void HandleCreate();
  void HandleJoin(const std::string& token);
  void HandleWatch(const std::string& token);
  void HandleActive(const ClientEvent& event);
  void HandlePlay(const PlayRequest& play);
  void SendEvent(const ServerEvent& event);
  void AbortWithProtocolError(std::string_view message);
  void TransitionToClosed(bool close_transport);
  void Log(LogLevel level, const std::string& name, const std::string& detail) const;

  std::weak_ptr<Connection> connection_;
  std::shared_ptr<SessionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
  std::string trace_id_;
  HandlerState state_{HandlerState::kInit};
  std::unique_ptr<Attachment> attachment_;
};

}  // namespace gameroom
