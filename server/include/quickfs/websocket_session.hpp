/*
 * 설명: WebSocket 연결의 읽기 루프, 백프레셔가 있는 송신 큐, 핸들러 콜백 전달을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/signaling_flow_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "quickfs/observability.hpp"
#include "quickfs/signaling_channel.hpp"

namespace quickfs {

class WebSocketSession : public SignalingChannel, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                   std::unique_ptr<ConnectionHandler> handler, std::shared_ptr<Observability> observability,
                   std::size_t max_queue_messages, std::size_t max_queue_bytes);
  ~WebSocketSession() override;
  void Run();

  void Send(std::string message) override;
  void Close() override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void StartClose(boost::beast::websocket::close_reason reason);
  void TriggerBackpressureClose();
  void Finish();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  std::unique_ptr<ConnectionHandler> handler_;
  std::shared_ptr<Observability> observability_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  bool finished_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace quickfs
