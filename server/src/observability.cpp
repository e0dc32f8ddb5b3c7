/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#include "gameroom/observability.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

namespace gameroom {

LogLevel ParseLogLevel(std::string_view value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::ConnectionOpened() { websocket_active_.fetch_add(1); }

void Observability::ConnectionClosed() { websocket_active_.fetch_sub(1); }

void Observability::IncrementMovesApplied() { moves_applied_.fetch_add(1); }

void Observability::IncrementMovesRejected() { moves_rejected_.fetch_add(1); }

void Observability::IncrementProtocolErrors() { protocol_errors_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot(std::uint64_t active_sessions) const {
  MetricsSnapshot snapshot;
  snapshot.websocket_active = websocket_active_.load();
  snapshot.active_sessions = active_sessions;
  snapshot.moves_applied = moves_applied_.load();
  snapshot.moves_rejected = moves_rejected_.load();
  snapshot.protocol_errors = protocol_errors_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!ShouldLog(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["traceId"] = ctx.trace_id;
  log_json["level"] = LogLevelName(ctx.level);
  log_json["eventName"] = ctx.name;
  if (ctx.session_id) {
    log_json["sessionId"] = *ctx.session_id;
  }
  if (!ctx.detail.empty()) {
    log_json["detail"] = ctx.detail;
  }
  auto line = log_json.dump();
  std::lock_guard<std::mutex> lock(output_mutex_);
  std::cout << line << std::endl;
}

nlohmann::json Observability::ToJson(const MetricsSnapshot& snapshot) {
  return {{"websocketActive", snapshot.websocket_active},
          {"activeSessions", snapshot.active_sessions},
          {"movesApplied", snapshot.moves_applied},
          {"movesRejected", snapshot.moves_rejected},
          {"protocolErrors", snapshot.protocol_errors}};
}

}  // namespace gameroom
