/*
 * 설명: 연결 핸들러와 전송 계층(WebSocket) 사이의 경계 인터페이스를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/relay_test.cpp, server/tests/unit/connection_handler_test.cpp
 */
#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace quickfs {

// 이중 채널 한 개. Send/Close는 어느 스레드에서 호출해도 되며 블로킹하지 않는다.
// 이미 닫힌 채널로 보낸 메시지는 조용히 버려진다.
class SignalingChannel {
 public:
  virtual ~SignalingChannel() = default;
  virtual void Send(std::string message) = 0;
  virtual void Close() = 0;
};

// 연결 하나의 프로토콜 로직. 세 콜백은 해당 연결의 스트랜드에서 순서대로 호출된다.
class ConnectionHandler {
 public:
  virtual ~ConnectionHandler() = default;
  virtual void OnOpen(const std::shared_ptr<SignalingChannel>& channel) = 0;
  // false를 반환하면 연결을 닫는다.
  virtual bool OnMessage(std::string_view text) = 0;
  virtual void OnClose() = 0;
};

}  // namespace quickfs
