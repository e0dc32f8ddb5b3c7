/*
 * 설명: HTTP 요청을 처리하고 헬스/메트릭 조회와 WS 업그레이드를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#include "gameroom/http_session.hpp"

#include <chrono>
#include <exception>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "gameroom/api_response.hpp"
#include "gameroom/websocket_session.hpp"

namespace gameroom {

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<SessionRegistry> registry, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), registry_(std::move(registry)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "gameroom");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string path{req_.target()};
  auto qpos = path.find('?');
  if (qpos != std::string::npos) {
    path = path.substr(0, qpos);
  }

  std::string body;
  if (req_.method() == http::verb::get && path == "/api/health") {
    res->result(http::status::ok);
    body = MakeSuccessEnvelope({{"status", "ok"}, {"version", std::string(kServerVersion)}}).dump();
  } else if (req_.method() == http::verb::get && path == "/api/metrics") {
    auto snapshot = observability_->Snapshot(registry_->ActiveCount());
    res->result(http::status::ok);
    body = MakeSuccessEnvelope(Observability::ToJson(snapshot)).dump();
  } else {
    res->result(http::status::not_found);
    body = MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다", {{"path", path}}).dump();
  }
  res->body() = body;
  res->content_length(body.size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    observability_->Log(LogContext{observability_->NextTraceId(), std::nullopt, "http.request",
                                   std::string(req_.target()) + " " + std::to_string(res->result_int()),
                                   LogLevel::kDebug});
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

void HttpSession::HandleWebSocket() {
  boost::beast::get_lowest_layer(stream_).expires_never();
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, "gameroom");
  }));
  try {
    ws.accept(req_);
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->Log(LogContext{"", std::nullopt, "ws.accept_failed", ex.what(), LogLevel::kWarn});
    }
    return;
  }
  std::make_shared<WebSocketSession>(std::move(ws), registry_, observability_, config_.ws_queue_limit_messages,
                                     config_.ws_queue_limit_bytes)
      ->Run();
}

}  // namespace gameroom
