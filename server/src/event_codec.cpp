/*
 * 설명: 클라이언트 메시지를 한 번만 검증해 이벤트로 변환하고 서버 이벤트를 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/event_codec_test.cpp
 */
#include "gameroom/event_codec.hpp"

#include <cstdint>
#include <limits>
#include <type_traits>

namespace gameroom {
namespace {
DecodeResult Reject(std::string_view code, std::string_view reason) {
  DecodeResult result;
  result.ok = false;
  result.code = std::string(code);
  result.reason = std::string(reason);
  return result;
}

DecodeResult Accept(ClientEvent event) {
  DecodeResult result;
  result.ok = true;
  result.event = std::move(event);
  return result;
}

bool ReadOptionalToken(const nlohmann::json& message, const char* key, std::optional<std::string>& out) {
  auto it = message.find(key);
  if (it == message.end() || it->is_null()) {
    return true;
  }
  if (!it->is_string()) {
    return false;
  }
  out = it->get<std::string>();
  return true;
}

DecodeResult DecodeInit(const nlohmann::json& message) {
  InitRequest init;
  if (!ReadOptionalToken(message, "join", init.join)) {
    return Reject(errors::kProtocolError, "join must be a string.");
  }
  if (!ReadOptionalToken(message, "watch", init.watch)) {
    return Reject(errors::kProtocolError, "watch must be a string.");
  }
  if (init.join && init.watch) {
    return Reject(errors::kProtocolError, "init cannot carry both join and watch.");
  }
  return Accept(init);
}

DecodeResult DecodePlay(const nlohmann::json& message) {
  auto column_it = message.find("column");
  if (column_it == message.end()) {
    return Reject(errors::kProtocolError, "column is required.");
  }
  if (!column_it->is_number_integer()) {
    return Reject(errors::kProtocolError, "column must be an integer.");
  }
  if (column_it->is_number_unsigned()) {
    const auto value = column_it->get<std::uint64_t>();
    if (value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
      return Reject(errors::kProtocolError, "column is out of range.");
    }
    return Accept(PlayRequest{static_cast<int>(value)});
  }
  const auto value = column_it->get<std::int64_t>();
  if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
    return Reject(errors::kProtocolError, "column is out of range.");
  }
  return Accept(PlayRequest{static_cast<int>(value)});
}
}  // namespace

DecodeResult DecodeClientEvent(std::string_view raw) {
  nlohmann::json message;
  try {
    message = nlohmann::json::parse(raw.begin(), raw.end());
  } catch (const nlohmann::json::exception&) {
    // 문법 오류뿐 아니라 숫자 범위 초과(out_of_range)도 여기서 잡힌다.
    return Reject(errors::kDecodeError, "Malformed message.");
  }

  if (!message.is_object()) {
    return Reject(errors::kProtocolError, "Message must be a JSON object.");
  }
  auto type_it = message.find("type");
  if (type_it == message.end() || !type_it->is_string()) {
    return Reject(errors::kProtocolError, "Message type is missing.");
  }
  const auto& type = type_it->get_ref<const std::string&>();
  if (type == "init") {
    return DecodeInit(message);
  }
  if (type == "play") {
    return DecodePlay(message);
  }
  return Reject(errors::kProtocolError, "Unknown message type.");
}

nlohmann::json ToJson(const ServerEvent& event) {
  return std::visit(
      [](const auto& e) -> nlohmann::json {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, InitEvent>) {
          return nlohmann::json{{"type", "init"}, {"join", e.join}, {"watch", e.watch}};
        } else if constexpr (std::is_same_v<T, PlayEvent>) {
          return nlohmann::json{
              {"type", "play"}, {"player", RoleName(e.player)}, {"column", e.column}, {"row", e.row}};
        } else if constexpr (std::is_same_v<T, WinEvent>) {
          return nlohmann::json{{"type", "win"}, {"player", RoleName(e.player)}};
        } else {
          return nlohmann::json{{"type", "error"}, {"message", e.message}};
        }
      },
      event);
}

std::string EncodeServerEvent(const ServerEvent& event) { return ToJson(event).dump(); }

}  // namespace gameroom
