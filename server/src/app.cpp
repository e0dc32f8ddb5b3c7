/*
 * 설명: 서버 수명주기, 리스너, 워커 스레드와 환경설정 로딩을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/game_flow_test.cpp
 */
#include "gameroom/app.hpp"

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "gameroom/connect_four.hpp"
#include "gameroom/http_session.hpp"

namespace gameroom {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<SessionRegistry> registry, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), registry_(std::move(registry)),
        observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
      boost::beast::error_code ec;
      self->acceptor_.close(ec);
    });
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->registry_, self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<SessionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)), signals_(ioc_, SIGINT, SIGTERM) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  registry_ = std::make_shared<SessionRegistry>([]() { return std::make_unique<ConnectFour>(); },
                                                config.token_bytes, observability_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    {
      std::lock_guard<std::mutex> lock(lifecycle_mutex_);
      running_ = true;
      boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
      listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, registry_, observability_);
      listener_->Run();
      signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
          return;
        }
        std::cout << "시그널 " << signal_number << " 수신, 종료를 준비합니다\n";
        // 워커 스레드에서 실행되므로 join하지 않고 이벤트 루프만 멈춘다. 정리는 Stop()이 맡는다.
        ioc_.stop();
      });
      std::cout << "서버 시작: 포트 " << config_.port << "\n";
      RunWorkers();
    }
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::RunWorkers() {
  const std::size_t thread_count =
      config_.worker_threads > 0 ? config_.worker_threads
                                 : std::max<std::size_t>(1, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (std::size_t i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Shutdown() {
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  boost::system::error_code ignored;
  signals_.cancel(ignored);
  ioc_.stop();
}

void ServerApp::Stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!running_) {
    return;
  }
  running_ = false;
  Shutdown();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  const int port = std::stoi(get_env("SERVER_PORT", "8080"));
  if (port <= 0 || port > std::numeric_limits<unsigned short>::max()) {
    throw std::out_of_range("SERVER_PORT must be in 1..65535");
  }
  cfg.port = static_cast<unsigned short>(port);
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.worker_threads = static_cast<std::size_t>(std::stoul(get_env("WORKER_THREADS", "0")));
  cfg.ws_queue_limit_messages = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_MESSAGES", "64")));
  cfg.ws_queue_limit_bytes = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_BYTES", "262144")));
  cfg.token_bytes = std::max(static_cast<std::size_t>(std::stoul(get_env("TOKEN_BYTES", "16"))),
                             SessionRegistry::kMinTokenBytes);
  return cfg;
}

}  // namespace gameroom
