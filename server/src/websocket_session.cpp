/*
 * 설명: WebSocket 메시지를 읽어 연결 핸들러에 전달하고, 서버 이벤트를 순서대로 전송하며 종료를 정리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/send_queue_test.cpp, server/tests/e2e/game_flow_test.cpp
 */
#include "gameroom/websocket_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket.hpp>

namespace gameroom {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   std::shared_ptr<SessionRegistry> registry,
                                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                                   std::size_t max_queue_bytes)
    : ws_(std::move(ws)), registry_(std::move(registry)), observability_(std::move(observability)),
      send_queue_(max_queue_messages, max_queue_bytes) {
  trace_id_ = observability_->NextTraceId();
  observability_->ConnectionOpened();
}

WebSocketSession::~WebSocketSession() {
  // 종료 경로와 무관하게 핸들러 소멸 시 세션 참가가 해제된다.
  handler_.reset();
  observability_->ConnectionClosed();
}

void WebSocketSession::Run() {
  handler_ = std::make_unique<ConnectionHandler>(weak_from_this(), registry_, observability_, trace_id_);
  observability_->Log(LogContext{trace_id_, std::nullopt, "ws.connected", {}, LogLevel::kDebug});
  DoRead();
}

void WebSocketSession::Send(std::string message) {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), message = std::move(message)]() mutable {
    self->EnqueueMessage(std::move(message));
  });
}

void WebSocketSession::Close() {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this()]() {
    self->NotifyClosed();
    self->BeginGracefulClose();
  });
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec) {
    if (ec != boost::beast::websocket::error::closed) {
      observability_->Log(LogContext{trace_id_, std::nullopt, "ws.read_failed", ec.message(), LogLevel::kDebug});
    }
    closing_ = true;
    NotifyClosed();
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  handler_->OnMessage(data);

  if (!closing_) {
    DoRead();
  }
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  if (!send_queue_.Push(std::move(message))) {
    TriggerBackpressureClose();
    return;
  }
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.Empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.Front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  writing_ = false;
  send_queue_.PopFront();
  if (ec) {
    observability_->Log(LogContext{trace_id_, std::nullopt, "ws.write_failed", ec.message(), LogLevel::kDebug});
    closing_ = true;
    send_queue_.DropPending(false);
    NotifyClosed();
    return;
  }
  if (!send_queue_.Empty()) {
    WriteNext();
  } else if (close_requested_) {
    DoClose();
  }
}

void WebSocketSession::TriggerBackpressureClose() {
  if (closing_) {
    return;
  }
  observability_->Log(LogContext{trace_id_, std::nullopt, "ws.backpressure_close", {}, LogLevel::kWarn});
  closing_ = true;
  send_queue_.DropPending(writing_);
  NotifyClosed();
  if (writing_) {
    // 전송 중인 메시지는 OnWrite가 꺼낸다. 소켓을 닫아 읽기도 중단시킨다.
    boost::beast::get_lowest_layer(ws_).close();
    return;
  }
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) {});
}

void WebSocketSession::BeginGracefulClose() {
  if (closing_ || close_requested_) {
    return;
  }
  close_requested_ = true;
  if (!writing_ && send_queue_.Empty()) {
    DoClose();
  }
}

void WebSocketSession::DoClose() {
  if (closing_) {
    return;
  }
  closing_ = true;
  auto self = shared_from_this();
  ws_.async_close(boost::beast::websocket::close_code::normal, [self](boost::beast::error_code ec) {
    if (ec) {
      self->observability_->Log(
          LogContext{self->trace_id_, std::nullopt, "ws.close_failed", ec.message(), LogLevel::kDebug});
    }
  });
}

void WebSocketSession::NotifyClosed() {
  if (handler_) {
    handler_->OnClosed();
  }
}

}  // namespace gameroom
