/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#include <exception>
#include <iostream>

#include "gameroom/app.hpp"

int main() {
  using namespace gameroom;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::exception& ex) {
    std::cerr << "환경설정 오류: " << ex.what() << "\n";
    return 1;
  }

  ServerApp app(config);
  app.Run();
  app.Stop();
  return 0;
}
