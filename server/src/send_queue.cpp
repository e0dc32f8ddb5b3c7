/*
 * 설명: 송신 대기열의 한도 검사와 정리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/send_queue_test.cpp
 */
#include "gameroom/send_queue.hpp"

namespace gameroom {

bool SendQueue::Push(std::string message) {
  if (messages_.size() >= max_messages_ || bytes_ + message.size() > max_bytes_) {
    return false;
  }
  bytes_ += message.size();
  messages_.push_back(std::move(message));
  return true;
}

void SendQueue::PopFront() {
  if (messages_.empty()) {
    return;
  }
  bytes_ -= messages_.front().size();
  messages_.pop_front();
}

void SendQueue::DropPending(bool in_flight) {
  if (in_flight && !messages_.empty()) {
    messages_.erase(messages_.begin() + 1, messages_.end());
    bytes_ = messages_.front().size();
    return;
  }
  messages_.clear();
  bytes_ = 0;
}

}  // namespace gameroom
