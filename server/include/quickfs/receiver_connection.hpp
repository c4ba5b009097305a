/*
 * 설명: 수신자 WebSocket 연결의 참여 핸드셰이크, 메시지 분기, 이탈 정리를 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_handler_test.cpp, server/tests/it/signaling_flow_it_test.cpp
 */
#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "quickfs/observability.hpp"
#include "quickfs/protocol.hpp"
#include "quickfs/relay.hpp"
#include "quickfs/session.hpp"
#include "quickfs/signaling_channel.hpp"

namespace quickfs {

class ReceiverConnection : public ConnectionHandler {
 public:
  enum class State { kConnected, kJoinPending, kJoined, kClosed };

  ReceiverConnection(std::shared_ptr<Session> session, std::shared_ptr<SignalingRelay> relay,
                     std::shared_ptr<Observability> observability);

  void OnOpen(const std::shared_ptr<SignalingChannel>& channel) override;
  bool OnMessage(std::string_view text) override;
  void OnClose() override;

  State GetState() const { return state_; }
  const std::string& ReceiverId() const { return receiver_id_; }

 private:
  bool HandleJoin(std::string_view text);
  void HandleJoined(const InboundMessage& message);

  std::shared_ptr<Session> session_;
  std::shared_ptr<SignalingRelay> relay_;
  std::shared_ptr<Observability> observability_;
  // 채널 수명은 WebSocketSession의 비동기 작업이 정한다.
  std::weak_ptr<SignalingChannel> channel_;
  std::string receiver_id_;
  std::string name_;
  State state_{State::kConnected};
};

}  // namespace quickfs
