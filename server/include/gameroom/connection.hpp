/*
 * 설명: 세션과 브로드캐스트가 참조하는 연결 핸들 인터페이스를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/broadcast_test.cpp, server/tests/unit/connection_handler_test.cpp
 */
#pragma once

#include <string>

namespace gameroom {

// 전송 계층이 수명을 소유한다. 세션은 weak_ptr로만 참조한다.
// Send/Close는 블로킹하지 않아야 하며 호출자에게 재진입하면 안 된다.
class Connection {
 public:
  virtual ~Connection() = default;

  virtual void Send(std::string message) = 0;
  virtual void Close() = 0;
};

}  // namespace gameroom
