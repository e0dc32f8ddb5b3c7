/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/observability_test.cpp, server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace gameroom {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view value);
std::string_view LogLevelName(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<std::string> session_id;
  std::string name;
  std::string detail;
  LogLevel level{LogLevel::kInfo};
};

struct MetricsSnapshot {
  std::uint64_t websocket_active{0};
  std::uint64_t active_sessions{0};
  std::uint64_t moves_applied{0};
  std::uint64_t moves_rejected{0};
  std::uint64_t protocol_errors{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  std::string NextTraceId();
  void ConnectionOpened();
  void ConnectionClosed();
  void IncrementMovesApplied();
  void IncrementMovesRejected();
  void IncrementProtocolErrors();
  MetricsSnapshot Snapshot(std::uint64_t active_sessions) const;
  bool ShouldLog(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;

  static nlohmann::json ToJson(const MetricsSnapshot& snapshot);

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> moves_applied_{0};
  std::atomic<std::uint64_t> moves_rejected_{0};
  std::atomic<std::uint64_t> protocol_errors_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  mutable std::mutex output_mutex_;
};

}  // namespace gameroom
