/*
 * 설명: 서버 전체 수명주기(리스너, 워커 스레드, 공유 서비스)를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/signaling_flow_it_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "quickfs/config.hpp"
#include "quickfs/observability.hpp"
#include "quickfs/relay.hpp"
#include "quickfs/session_registry.hpp"

namespace quickfs {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  // 리스너를 열고 워커 스레드를 띄운 뒤 바로 반환한다.
  void Start();
  // Start 후 SIGINT/SIGTERM을 받을 때까지 블로킹한다. 리스너를 열지 못하면 false.
  bool Run();
  void Stop();

  unsigned short BoundPort() const;
  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<SessionRegistry> GetRegistry() { return registry_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers(std::size_t count);

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<SessionRegistry> registry_;
  std::shared_ptr<SignalingRelay> relay_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace quickfs
