/*
 * 설명: 하나의 게임 엔진과 연결 목록을 소유하고 수 적용을 직렬화하는 게임 세션을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/session_test.cpp, server/tests/unit/connection_handler_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "gameroom/broadcast.hpp"
#include "gameroom/connection.hpp"
#include "gameroom/event_codec.hpp"
#include "gameroom/game_engine.hpp"
#include "gameroom/observability.hpp"

namespace gameroom {

enum class JoinMode { kPlay, kWatch };

struct MoveResult {
  bool accepted{false};
  std::string code;
  std::string reason;
  int row{0};
  bool terminal{false};
};

class Session;

// 세션 참가를 나타내는 스코프 자원. 소멸 시 반드시 Detach가 실행된다.
class Attachment {
 public:
  Attachment(std::shared_ptr<Session> session, const Connection* connection, Role role);
  ~Attachment();

  Attachment(const Attachment&) = delete;
  Attachment& operator=(const Attachment&) = delete;

  Role GetRole() const { return role_; }
  Session& GetSession() const { return *session_; }

 private:
  std::shared_ptr<Session> session_;
  const Connection* connection_;
  Role role_;
};

class Session : public std::enable_shared_from_this<Session> {
 public:
  using ReleaseHook = std::function<void(const Session&)>;

  Session(std::string id, std::string join_token, std::string watch_token, std::unique_ptr<GameEngine> engine,
          std::shared_ptr<Observability> observability, ReleaseHook on_empty);

  const std::string& Id() const { return id_; }
  const std::string& JoinToken() const { return join_token_; }
  const std::string& WatchToken() const { return watch_token_; }

  // 이미 해제된 세션이거나 같은 연결이 이미 참가 중이면 nullptr을 반환한다.
  // 두 경우는 RoleOf(connection)로 구분한다.
  std::unique_ptr<Attachment> Attach(const std::shared_ptr<Connection>& connection, JoinMode mode);
  void Detach(const Connection* connection);

  // 엔진 적용과 play/win 브로드캐스트를 같은 락 안에서 수행한다.
  MoveResult ApplyMove(Role role, int column);

  void Broadcast(const ServerEvent& event);
  void Broadcast(const ServerEvent& event, const std::vector<Role>& roles);

  std::size_t AttachedCount() const;
  std::size_t CountRole(Role role) const;
  std::optional<Role> RoleOf(const Connection* connection) const;
  bool IsClosed() const;
  bool IsFinished() const;

 private:
  struct Entry {
    const Connection* raw{nullptr};
    std::weak_ptr<Connection> connection;
    Role role{Role::kSpectator};
  };

  bool HasRoleLocked(Role role) const;
  void BroadcastLocked(const ServerEvent& event, const std::vector<Role>& roles);
  void Log(LogLevel level, const std::string& name, const std::string& detail) const;

  std::string id_;
  std::string join_token_;
  std::string watch_token_;
  std::unique_ptr<GameEngine> engine_;
  std::shared_ptr<Observability> observability_;
  BroadcastDispatcher dispatcher_;
  ReleaseHook on_empty_;
  std::vector<Entry> entries_;
  std::vector<PlayEvent> history_;
  bool finished_{false};
  bool closed_{false};
  mutable std::mutex mutex_;
};

}  // namespace gameroom
