/*
 * 설명: 연결별 핸드셰이크(create/join/watch), 착수 요청 처리, 종료 시 참가 해제를 수행한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/connection_handler_test.cpp, server/tests/e2e/game_flow_test.cpp
 */
#include "gameroom/connection_handler.hpp"

namespace gameroom {

ConnectionHandler::ConnectionHandler(std::weak_ptr<Connection> connection,
                                     std::shared_ptr<SessionRegistry> registry,
                                     std::shared_ptr<Observability> observability, std::string trace_id)
    : connection_(std::move(connection)), registry_(std::move(registry)), observability_(std::move(observability)),
      trace_id_(std::move(trace_id)) {}

ConnectionHandler::~ConnectionHandler() { TransitionToClosed(false); }

void ConnectionHandler::OnMessage(std::string_view raw) {
  if (state_ == HandlerState::kClosed) {
    Log(LogLevel::kDebug, "handler.ignored", "message after close");
    return;
  }

  auto decoded = DecodeClientEvent(raw);
  if (!decoded.ok) {
    Log(LogLevel::kWarn, "handler." + decoded.code, decoded.reason);
    return AbortWithProtocolError(decoded.reason);
  }

  if (state_ == HandlerState::kInit) {
    HandleInit(decoded.event);
  } else {
    HandleActive(decoded.event);
  }
}

void ConnectionHandler::OnClosed() { TransitionToClosed(false); }

std::optional<Role> ConnectionHandler::CurrentRole() const {
  if (!attachment_) {
    return std::nullopt;
  }
  return attachment_->GetRole();
}

std::optional<std::string> ConnectionHandler::SessionId() const {
  if (!attachment_) {
    return std::nullopt;
  }
  return attachment_->GetSession().Id();
}

void ConnectionHandler::HandleInit(const ClientEvent& event) {
  const auto* init = std::get_if<InitRequest>(&event);
  if (!init) {
    return AbortWithProtocolError("Expected init as the first message.");
  }
  if (init->join) {
    HandleJoin(*init->join);
  } else if (init->watch) {
    HandleWatch(*init->watch);
  } else {
    HandleCreate();
  }
}

void ConnectionHandler::HandleCreate() {
  auto connection = connection_.lock();
  if (!connection) {
    return TransitionToClosed(false);
  }
  auto handle = registry_->Create();
  attachment_ = handle.session->Attach(connection, JoinMode::kPlay);
  if (!attachment_) {
    SendEvent(ErrorEvent{"Game not found."});
    return TransitionToClosed(true);
  }
  state_ = HandlerState::kActive;
  SendEvent(InitEvent{handle.join_token, handle.watch_token});
  Log(LogLevel::kInfo, "handler.created", std::string(RoleName(attachment_->GetRole())));
}

void ConnectionHandler::HandleJoin(const std::string& token) {
  auto connection = connection_.lock();
  if (!connection) {
    return TransitionToClosed(false);
  }
  auto session = registry_->LookupJoin(token);
  if (session) {
    attachment_ = session->Attach(connection, JoinMode::kPlay);
  }
  if (!attachment_ && session && session->RoleOf(connection.get())) {
    return AbortWithProtocolError("Already initialized.");
  }
  if (!attachment_) {
    // 조회 직후 해제된 세션도 찾지 못한 것으로 처리한다.
    Log(LogLevel::kInfo, "handler." + std::string(errors::kGameNotFound), "join");
    SendEvent(ErrorEvent{"Game not found."});
    return TransitionToClosed(true);
  }
  state_ = HandlerState::kActive;
  Log(LogLevel::kInfo, "handler.joined", std::string(RoleName(attachment_->GetRole())));
}

void ConnectionHandler::HandleWatch(const std::string& token) {
  auto connection = connection_.lock();
  if (!connection) {
    return TransitionToClosed(false);
  }
  auto session = registry_->LookupWatch(token);
  if (session) {
    attachment_ = session->Attach(connection, JoinMode::kWatch);
  }
  if (!attachment_ && session && session->RoleOf(connection.get())) {
    return AbortWithProtocolError("Already initialized.");
  }
  if (!attachment_) {
    Log(LogLevel::kInfo, "handler." + std::string(errors::kGameNotFound), "watch");
    SendEvent(ErrorEvent{"Game not found."});
    return TransitionToClosed(true);
  }
  state_ = HandlerState::kActive;
  Log(LogLevel::kInfo, "handler.watching", {});
}

void ConnectionHandler::HandleActive(const ClientEvent& event) {
  if (std::holds_alternative<InitRequest>(event)) {
    return AbortWithProtocolError("Already initialized.");
  }
  HandlePlay(std::get<PlayRequest>(event));
}

void ConnectionHandler::HandlePlay(const PlayRequest& play) {
  if (attachment_->GetRole() == Role::kSpectator) {
    if (observability_) {
      observability_->IncrementMovesRejected();
    }
    SendEvent(ErrorEvent{"Spectators cannot play."});
    return;
  }

  auto result = attachment_->GetSession().ApplyMove(attachment_->GetRole(), play.column);
  if (result.accepted) {
    if (observability_) {
      observability_->IncrementMovesApplied();
    }
    if (result.terminal) {
      Log(LogLevel::kInfo, "handler.game_won", {});
      TransitionToClosed(true);
    }
    return;
  }

  if (observability_) {
    observability_->IncrementMovesRejected();
  }
  if (result.code == errors::kEngineFault) {
    Log(LogLevel::kError, "handler." + result.code, result.reason);
    SendEvent(ErrorEvent{result.reason});
    return TransitionToClosed(true);
  }
  Log(LogLevel::kDebug, "handler." + result.code, result.reason);
  SendEvent(ErrorEvent{result.reason});
}

void ConnectionHandler::SendEvent(const ServerEvent& event) {
  auto connection = connection_.lock();
  if (!connection) {
    return;
  }
  connection->Send(EncodeServerEvent(event));
}

void ConnectionHandler::AbortWithProtocolError(std::string_view message) {
  if (observability_) {
    observability_->IncrementProtocolErrors();
  }
  SendEvent(ErrorEvent{std::string(message)});
  TransitionToClosed(true);
}

void ConnectionHandler::TransitionToClosed(bool close_transport) {
  if (state_ == HandlerState::kClosed) {
    return;
  }
  state_ = HandlerState::kClosed;
  attachment_.reset();
  Log(LogLevel::kDebug, "handler.closed", {});
  if (close_transport) {
    if (auto connection = connection_.lock()) {
      connection->Close();
    }
  }
}

void ConnectionHandler::Log(LogLevel level, const std::string& name, const std::string& detail) const {
  if (!observability_) {
    return;
  }
  observability_->Log(LogContext{trace_id_, SessionId(), name, detail, level});
}

}  // namespace gameroom
