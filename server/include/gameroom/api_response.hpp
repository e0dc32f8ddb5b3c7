/*
 * 설명: 운영용 HTTP 응답 엔벨로프(success/data/error/meta)를 만든다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

namespace gameroom {

inline constexpr std::string_view kServerVersion = "v1.0.0";

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
// detail이 비어 있으면 null로 기록된다.
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message,
                                 const nlohmann::json& detail = nullptr);

}  // namespace gameroom
