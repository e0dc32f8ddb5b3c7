/*
 * 설명: 충돌 없는 토큰으로 세션을 생성하고 참가/관전 토큰 조회와 해제를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/session_registry_test.cpp
 */
#include "gameroom/session_registry.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/rand.h>

namespace gameroom {
namespace {
std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}
}  // namespace

std::string GenerateRandomToken(std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return BytesToHex(buffer.data(), buffer.size());
}

SessionRegistry::SessionRegistry(GameEngineFactory engine_factory, std::size_t token_bytes,
                                 std::shared_ptr<Observability> observability)
    : engine_factory_(std::move(engine_factory)), token_bytes_(std::max(token_bytes, kMinTokenBytes)),
      observability_(std::move(observability)) {
  token_generator_ = [bytes = token_bytes_]() { return GenerateRandomToken(bytes); };
}

void SessionRegistry::SetTokenGenerator(TokenGenerator generator) {
  std::lock_guard<std::mutex> lock(mutex_);
  token_generator_ = std::move(generator);
}

SessionHandle SessionRegistry::Create() {
  auto engine = engine_factory_();
  std::shared_ptr<Session> session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto join_token = GenerateUniqueTokenLocked({});
    auto watch_token = GenerateUniqueTokenLocked(join_token);
    std::ostringstream id;
    id << "session-" << next_session_id_++;

    std::weak_ptr<SessionRegistry> weak_self = weak_from_this();
    session = std::make_shared<Session>(id.str(), join_token, watch_token, std::move(engine), observability_,
                                        [weak_self](const Session& released) {
                                          if (auto self = weak_self.lock()) {
                                            self->Release(released.JoinToken());
                                          }
                                        });
    join_tokens_[join_token] = session;
    watch_tokens_[watch_token] = session;
  }
  if (observability_) {
    observability_->Log(LogContext{"", session->Id(), "session.created", {}, LogLevel::kInfo});
  }
  return SessionHandle{session->JoinToken(), session->WatchToken(), session};
}

std::shared_ptr<Session> SessionRegistry::LookupJoin(const std::string& token) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = join_tokens_.find(token);
  return it == join_tokens_.end() ? nullptr : it->second;
}

std::shared_ptr<Session> SessionRegistry::LookupWatch(const std::string& token) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = watch_tokens_.find(token);
  return it == watch_tokens_.end() ? nullptr : it->second;
}

void SessionRegistry::Release(const std::string& join_token) {
  std::shared_ptr<Session> released;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = join_tokens_.find(join_token);
    if (it == join_tokens_.end()) {
      return;
    }
    released = std::move(it->second);
    join_tokens_.erase(it);
    watch_tokens_.erase(released->WatchToken());
  }
  // 마지막 참조가 여기서 사라질 수 있으므로 세션 소멸은 락 밖에서 일어나게 한다.
  if (observability_) {
    observability_->Log(LogContext{"", released->Id(), "session.removed", {}, LogLevel::kDebug});
  }
}

std::size_t SessionRegistry::ActiveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return join_tokens_.size();
}

std::string SessionRegistry::GenerateUniqueTokenLocked(const std::string& reserved) {
  for (;;) {
    auto token = token_generator_();
    if (token.empty() || token == reserved || IsTokenInUseLocked(token)) {
      continue;
    }
    return token;
  }
}

bool SessionRegistry::IsTokenInUseLocked(const std::string& token) const {
  return join_tokens_.count(token) > 0 || watch_tokens_.count(token) > 0;
}

}  // namespace gameroom
