/*
 * 설명: HTTP 연결을 처리하고 업로드/참여 요청 검증 후 WebSocket 업그레이드를 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/signaling_flow_it_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "quickfs/config.hpp"
#include "quickfs/observability.hpp"
#include "quickfs/relay.hpp"
#include "quickfs/session_registry.hpp"
#include "quickfs/signaling_channel.hpp"

namespace quickfs {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<SessionRegistry> registry, std::shared_ptr<SignalingRelay> relay,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleUpload(const std::string& query);
  void HandleJoin(const std::string& session_id);
  void SendJson(boost::beast::http::status status, const nlohmann::json& body);
  void SendError(boost::beast::http::status status, std::string_view code, std::string_view message);
  void SendResponse(std::shared_ptr<Response> res);
  void UpgradeTo(std::unique_ptr<ConnectionHandler> handler);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<SessionRegistry> registry_;
  std::shared_ptr<SignalingRelay> relay_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace quickfs
