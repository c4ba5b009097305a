/*
 * 설명: 호스트 WebSocket 연결의 세션 생성, 메시지 분기, 종료 시 세션 해체를 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_handler_test.cpp, server/tests/it/signaling_flow_it_test.cpp
 */
#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "quickfs/observability.hpp"
#include "quickfs/relay.hpp"
#include "quickfs/session.hpp"
#include "quickfs/session_registry.hpp"
#include "quickfs/signaling_channel.hpp"

namespace quickfs {

class HostConnection : public ConnectionHandler {
 public:
  HostConnection(FileMetadata metadata, std::shared_ptr<SessionRegistry> registry,
                 std::shared_ptr<SignalingRelay> relay, std::shared_ptr<Observability> observability);

  void OnOpen(const std::shared_ptr<SignalingChannel>& channel) override;
  bool OnMessage(std::string_view text) override;
  void OnClose() override;

  std::shared_ptr<Session> GetSession() const { return session_; }

 private:
  FileMetadata metadata_;
  std::shared_ptr<SessionRegistry> registry_;
  std::shared_ptr<SignalingRelay> relay_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<Session> session_;
  bool closed_{false};
};

}  // namespace quickfs
