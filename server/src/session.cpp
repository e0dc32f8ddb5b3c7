/*
 * 설명: 역할 배정, 참가 해제, 수 적용 직렬화와 결과 브로드캐스트를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/session_test.cpp, server/tests/unit/connection_handler_test.cpp
 */
#include "gameroom/session.hpp"

#include <algorithm>
#include <exception>

namespace gameroom {
namespace {
const std::vector<Role>& AllRoles() {
  static const std::vector<Role> roles{Role::kPlayer1, Role::kPlayer2, Role::kSpectator};
  return roles;
}

MoveResult Rejected(std::string_view code, std::string reason) {
  MoveResult result;
  result.accepted = false;
  result.code = std::string(code);
  result.reason = std::move(reason);
  return result;
}
}  // namespace

Attachment::Attachment(std::shared_ptr<Session> session, const Connection* connection, Role role)
    : session_(std::move(session)), connection_(connection), role_(role) {}

Attachment::~Attachment() { session_->Detach(connection_); }

Session::Session(std::string id, std::string join_token, std::string watch_token,
                 std::unique_ptr<GameEngine> engine, std::shared_ptr<Observability> observability,
                 ReleaseHook on_empty)
    : id_(std::move(id)), join_token_(std::move(join_token)), watch_token_(std::move(watch_token)),
      engine_(std::move(engine)), observability_(std::move(observability)), dispatcher_(observability_),
      on_empty_(std::move(on_empty)) {}

std::unique_ptr<Attachment> Session::Attach(const std::shared_ptr<Connection>& connection, JoinMode mode) {
  Role role = Role::kSpectator;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return nullptr;
    }
    auto existing = std::find_if(entries_.begin(), entries_.end(),
                                 [&connection](const Entry& entry) { return entry.raw == connection.get(); });
    if (existing != entries_.end()) {
      return nullptr;
    }
    if (mode == JoinMode::kPlay) {
      if (!HasRoleLocked(Role::kPlayer1)) {
        role = Role::kPlayer1;
      } else if (!HasRoleLocked(Role::kPlayer2)) {
        role = Role::kPlayer2;
      }
    }
    entries_.push_back(Entry{connection.get(), connection, role});

    // 이후 브로드캐스트보다 먼저 도착하도록 락 안에서 지난 수를 재생한다.
    std::vector<std::weak_ptr<Connection>> target{connection};
    for (const auto& played : history_) {
      dispatcher_.Deliver(played, target);
    }
  }
  Log(LogLevel::kInfo, "session.attach", std::string(RoleName(role)));
  return std::make_unique<Attachment>(shared_from_this(), connection.get(), role);
}

void Session::Detach(const Connection* connection) {
  bool release = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [connection](const Entry& entry) { return entry.raw == connection; });
    if (it == entries_.end()) {
      return;
    }
    entries_.erase(it);
    if (entries_.empty() && !closed_) {
      closed_ = true;
      release = true;
    }
  }
  Log(LogLevel::kDebug, "session.detach", {});
  if (release) {
    Log(LogLevel::kInfo, "session.released", "no attached connections");
    if (on_empty_) {
      on_empty_(*this);
    }
  }
}

MoveResult Session::ApplyMove(Role role, int column) {
  MoveResult result;
  std::vector<std::weak_ptr<Connection>> to_close;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_ || closed_) {
      return Rejected(errors::kIllegalMove, "Game is over.");
    }
    if (role == Role::kSpectator) {
      return Rejected(errors::kIllegalMove, "Spectators cannot play.");
    }

    MoveOutcome outcome;
    try {
      outcome = engine_->Play(role, column);
    } catch (const std::exception& ex) {
      Log(LogLevel::kError, "session.engine_fault", ex.what());
      return Rejected(errors::kEngineFault, "Internal error.");
    }
    if (!outcome.accepted) {
      return Rejected(errors::kIllegalMove, outcome.reason);
    }

    PlayEvent played{role, column, outcome.row};
    history_.push_back(played);
    BroadcastLocked(played, AllRoles());
    result.accepted = true;
    result.row = outcome.row;

    auto winner = engine_->Winner();
    if (winner) {
      finished_ = true;
      result.terminal = true;
      BroadcastLocked(WinEvent{*winner}, AllRoles());
      for (const auto& entry : entries_) {
        to_close.push_back(entry.connection);
      }
      entries_.clear();
      closed_ = true;
    }
  }

  if (result.terminal) {
    Log(LogLevel::kInfo, "session.finished", std::string(RoleName(role)) + " won");
    if (on_empty_) {
      on_empty_(*this);
    }
    for (const auto& weak : to_close) {
      if (auto connection = weak.lock()) {
        connection->Close();
      }
    }
  }
  return result;
}

void Session::Broadcast(const ServerEvent& event) { Broadcast(event, AllRoles()); }

void Session::Broadcast(const ServerEvent& event, const std::vector<Role>& roles) {
  std::lock_guard<std::mutex> lock(mutex_);
  BroadcastLocked(event, roles);
}

void Session::BroadcastLocked(const ServerEvent& event, const std::vector<Role>& roles) {
  std::vector<std::weak_ptr<Connection>> recipients;
  recipients.reserve(entries_.size());
  for (const auto& entry : entries_) {
    if (std::find(roles.begin(), roles.end(), entry.role) != roles.end()) {
      recipients.push_back(entry.connection);
    }
  }
  dispatcher_.Deliver(event, recipients);
}

bool Session::HasRoleLocked(Role role) const {
  return std::any_of(entries_.begin(), entries_.end(), [role](const Entry& entry) { return entry.role == role; });
}

std::size_t Session::AttachedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::size_t Session::CountRole(Role role) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(
      std::count_if(entries_.begin(), entries_.end(), [role](const Entry& entry) { return entry.role == role; }));
}

std::optional<Role> Session::RoleOf(const Connection* connection) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& entry : entries_) {
    if (entry.raw == connection) {
      return entry.role;
    }
  }
  return std::nullopt;
}

bool Session::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

bool Session::IsFinished() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return finished_;
}

void Session::Log(LogLevel level, const std::string& name, const std::string& detail) const {
  if (!observability_) {
    return;
  }
  observability_->Log(LogContext{"", id_, name, detail, level});
}

}  // namespace gameroom
