/*
 * 설명: WebSocket 연결의 읽기/쓰기 큐, 백프레셔, 종료를 관리하고 연결 핸들러를 구동한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/send_queue_test.cpp, server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "gameroom/connection.hpp"
#include "gameroom/connection_handler.hpp"
#include "gameroom/observability.hpp"
#include "gameroom/send_queue.hpp"
#include "gameroom/session_registry.hpp"

namespace gameroom {

class WebSocketSession : public Connection, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                   std::shared_ptr<SessionRegistry> registry, std::shared_ptr<Observability> observability,
                   std::size_t max_queue_messages, std::size_t max_queue_bytes);
  ~WebSocketSession() override;
  void Run();

  // 다른 스레드에서 호출될 수 있으므로 연결 strand로 post한다.
  void Send(std::string message) override;
  void Close() override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();
  void BeginGracefulClose();
  void DoClose();
  void NotifyClosed();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  std::shared_ptr<SessionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
  std::unique_ptr<ConnectionHandler> handler_;
  std::string trace_id_;
  SendQueue send_queue_;
  bool writing_{false};
  bool close_requested_{false};
  bool closing_{false};
};

}  // namespace gameroom
