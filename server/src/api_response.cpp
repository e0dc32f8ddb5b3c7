/*
 * 설명: HTTP 응답 엔벨로프와 메타 정보(서버 버전, UTC 시각)를 채운다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "gameroom/api_response.hpp"

#include <array>
#include <chrono>
#include <ctime>
#include <string>

namespace gameroom {
namespace {
nlohmann::json BuildMeta() {
  auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm utc{};
  gmtime_r(&now, &utc);
  std::array<char, 32> stamp{};
  std::strftime(stamp.data(), stamp.size(), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return {{"timestamp", stamp.data()}, {"server", std::string(kServerVersion)}};
}

nlohmann::json Envelope(bool success, nlohmann::json data, nlohmann::json error) {
  return {{"success", success}, {"data", std::move(data)}, {"error", std::move(error)}, {"meta", BuildMeta()}};
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) { return Envelope(true, data, nullptr); }

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message, const nlohmann::json& detail) {
  return Envelope(false, nullptr, {{"code", code}, {"message", message}, {"detail", detail}});
}

}  // namespace gameroom
