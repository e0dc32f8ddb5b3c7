/*
 * 설명: 연결별 송신 대기열. 메시지 수/바이트 한도를 검사하고 전송 중인 맨 앞 메시지를 보호한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/send_queue_test.cpp
 */
#pragma once

#include <cstddef>
#include <deque>
#include <string>

namespace gameroom {

// 연결 strand에서만 사용한다.
class SendQueue {
 public:
  SendQueue(std::size_t max_messages, std::size_t max_bytes) : max_messages_(max_messages), max_bytes_(max_bytes) {}

  // 한도를 넘으면 메시지를 넣지 않고 false를 반환한다.
  bool Push(std::string message);

  bool Empty() const { return messages_.empty(); }
  std::size_t Size() const { return messages_.size(); }
  std::size_t Bytes() const { return bytes_; }
  const std::string& Front() const { return messages_.front(); }

  void PopFront();
  // in_flight이면 async_write가 참조 중인 맨 앞 메시지는 남긴다.
  void DropPending(bool in_flight);

 private:
  std::deque<std::string> messages_;
  std::size_t bytes_{0};
  std::size_t max_messages_;
  std::size_t max_bytes_;
};

}  // namespace gameroom
