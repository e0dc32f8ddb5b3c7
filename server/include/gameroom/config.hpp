/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace gameroom {

struct AppConfig {
  unsigned short port{8080};
  std::string log_level{"info"};
  std::size_t worker_threads{0};
  std::size_t ws_queue_limit_messages{64};
  std::size_t ws_queue_limit_bytes{262144};
  std::size_t token_bytes{16};
};

AppConfig LoadConfigFromEnv();

}  // namespace gameroom
