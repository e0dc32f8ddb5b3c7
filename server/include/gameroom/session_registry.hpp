/*
 * 설명: 참가/관전 토큰으로 게임 세션을 생성, 조회, 해제하는 프로세스 단위 레지스트리.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/session_registry_test.cpp, server/tests/unit/connection_handler_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "gameroom/game_engine.hpp"
#include "gameroom/observability.hpp"
#include "gameroom/session.hpp"

namespace gameroom {

struct SessionHandle {
  std::string join_token;
  std::string watch_token;
  std::shared_ptr<Session> session;
};

class SessionRegistry : public std::enable_shared_from_this<SessionRegistry> {
 public:
  using TokenGenerator = std::function<std::string()>;

  static constexpr std::size_t kMinTokenBytes = 12;

  SessionRegistry(GameEngineFactory engine_factory, std::size_t token_bytes,
                  std::shared_ptr<Observability> observability);

  void SetTokenGenerator(TokenGenerator generator);

  SessionHandle Create();
  std::shared_ptr<Session> LookupJoin(const std::string& token) const;
  std::shared_ptr<Session> LookupWatch(const std::string& token) const;
  void Release(const std::string& join_token);
  std::size_t ActiveCount() const;

 private:
  std::string GenerateUniqueTokenLocked(const std::string& reserved);
  bool IsTokenInUseLocked(const std::string& token) const;

  GameEngineFactory engine_factory_;
  std::size_t token_bytes_;
  std::shared_ptr<Observability> observability_;
  TokenGenerator token_generator_;
  std::size_t next_session_id_{1};
  std::unordered_map<std::string, std::shared_ptr<Session>> join_tokens_;
  std::unordered_map<std::string, std::shared_ptr<Session>> watch_tokens_;
  mutable std::mutex mutex_;
};

std::string GenerateRandomToken(std::size_t bytes);

}  // namespace gameroom
