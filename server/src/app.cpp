/*
 * 설명: 서버 수명주기와 리스닝/워커 스레드, 환경설정 로딩을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/signaling_flow_it_test.cpp, server/tests/unit/config_test.cpp
 */
#include "quickfs/app.hpp"

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "quickfs/http_session.hpp"

namespace quickfs {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<SessionRegistry> registry, std::shared_ptr<SignalingRelay> relay,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), registry_(std::move(registry)),
        relay_(std::move(relay)), observability_(std::move(observability)) {
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

  unsigned short Port() const {
    boost::beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
  }

 private:
  void DoAccept() {
    // 연결마다 별도 스트랜드를 준다. 핸들러 콜백은 그 스트랜드에서 순서대로 실행된다.
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->registry_, self->relay_,
                                          self->observability_)
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
  std::shared_ptr<SignalingRelay> relay_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  registry_ = std::make_shared<SessionRegistry>();
  relay_ = std::make_shared<SignalingRelay>(observability_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Start() {
  if (running_) {
    return;
  }
  boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
  listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, registry_, relay_, observability_);
  listener_->Run();
  running_ = true;
  std::size_t thread_count = config_.worker_threads;
  if (thread_count == 0) {
    thread_count = std::max(1u, std::thread::hardware_concurrency());
  }
  RunWorkers(thread_count);
  observability_->LogEvent(LogLevel::kInfo, "server.started", std::nullopt, std::nullopt,
                           "port " + std::to_string(BoundPort()));
}

bool ServerApp::Run() {
  try {
    Start();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
    return false;
  }
  boost::asio::io_context signal_ioc;
  boost::asio::signal_set signals(signal_ioc, SIGINT, SIGTERM);
  signals.async_wait([](const boost::system::error_code&, int) {});
  signal_ioc.run();
  observability_->LogEvent(LogLevel::kInfo, "server.stopping", std::nullopt);
  Stop();
  return true;
}

void ServerApp::RunWorkers(std::size_t count) {
  for (std::size_t i = 0; i < count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

unsigned short ServerApp::BoundPort() const { return listener_ ? listener_->Port() : 0; }

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };
  // stoul은 음수를 조용히 감싸므로 부호를 먼저 거른다.
  auto get_count = [&get_env](const char* key, const char* def) -> std::size_t {
    auto value = get_env(key, def);
    auto first = value.find_first_not_of(" \t\n\v\f\r");
    if (first != std::string::npos && value[first] == '-') {
      throw std::out_of_range(std::string{key} + " 값은 음수일 수 없습니다");
    }
    return static_cast<std::size_t>(std::stoull(value));
  };

  AppConfig cfg;
  auto port = std::stol(get_env("SERVER_PORT", "3000"));
  if (port < 0 || port > std::numeric_limits<unsigned short>::max()) {
    throw std::out_of_range("SERVER_PORT 값이 포트 범위를 벗어났습니다");
  }
  cfg.port = static_cast<unsigned short>(port);
  cfg.worker_threads = get_count("SERVER_THREADS", "0");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.ws_queue_limit_messages = get_count("WS_QUEUE_LIMIT_MESSAGES", "256");
  cfg.ws_queue_limit_bytes = get_count("WS_QUEUE_LIMIT_BYTES", "1048576");
  return cfg;
}

}  // namespace quickfs
