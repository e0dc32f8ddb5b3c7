/*
 * 설명: WebSocket 메시지 엔벨로프를 닫힌 이벤트 타입으로 검증/변환한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/event_codec_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "gameroom/game_engine.hpp"

namespace gameroom {

namespace errors {
inline constexpr std::string_view kGameNotFound = "game_not_found";
inline constexpr std::string_view kIllegalMove = "illegal_move";
inline constexpr std::string_view kProtocolError = "protocol_error";
inline constexpr std::string_view kDecodeError = "decode_error";
inline constexpr std::string_view kEngineFault = "engine_fault";
}  // namespace errors

// 클라이언트 -> 서버
struct InitRequest {
  std::optional<std::string> join;
  std::optional<std::string> watch;
};

struct PlayRequest {
  int column{0};
};

using ClientEvent = std::variant<InitRequest, PlayRequest>;

// 서버 -> 클라이언트
struct InitEvent {
  std::string join;
  std::string watch;
};

struct PlayEvent {
  Role player;
  int column;
  int row;
};

struct WinEvent {
  Role player;
};

struct ErrorEvent {
  std::string message;
};

using ServerEvent = std::variant<InitEvent, PlayEvent, WinEvent, ErrorEvent>;

struct DecodeResult {
  bool ok{false};
  ClientEvent event;
  std::string code;
  std::string reason;
};

DecodeResult DecodeClientEvent(std::string_view raw);

nlohmann::json ToJson(const ServerEvent& event);
std::string EncodeServerEvent(const ServerEvent& event);

}  // namespace gameroom
