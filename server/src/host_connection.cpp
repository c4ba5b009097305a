/*
 * 설명: 호스트 연결에서 세션을 만들고, 들어오는 메시지를 릴레이로 넘기며, 종료 시 세션을 해체한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_handler_test.cpp, server/tests/it/signaling_flow_it_test.cpp
 */
#include "quickfs/host_connection.hpp"

#include "quickfs/protocol.hpp"

namespace quickfs {

HostConnection::HostConnection(FileMetadata metadata, std::shared_ptr<SessionRegistry> registry,
                               std::shared_ptr<SignalingRelay> relay, std::shared_ptr<Observability> observability)
    : metadata_(std::move(metadata)), registry_(std::move(registry)), relay_(std::move(relay)),
      observability_(std::move(observability)) {}

void HostConnection::OnOpen(const std::shared_ptr<SignalingChannel>& channel) {
  session_ = registry_->Create(metadata_, channel);
  channel->Send(MakeSignalMessage(msg::kUploadCreated, {{"id", session_->Id()}}));
  if (observability_) {
    observability_->LogEvent(LogLevel::kInfo, "session.created", session_->Id(), std::nullopt,
                             metadata_.filename + " (" + std::to_string(metadata_.filesize) + " bytes)");
  }
}

bool HostConnection::OnMessage(std::string_view text) {
  if (!session_) {
    return false;
  }
  auto message = ParseInboundMessage(text);
  if (!message) {
    return false;
  }
  switch (ClassifyHostMessage(message->type)) {
    case HostInbound::kGetReceivers:
      relay_->NotifyMembership(*session_);
      break;
    case HostInbound::kOffer:
      relay_->Forward(*session_, Origin::kHost, SignalKind::kOffer, message->payload);
      break;
    case HostInbound::kAnswer:
      relay_->Forward(*session_, Origin::kHost, SignalKind::kAnswer, message->payload);
      break;
    case HostInbound::kIceCandidate:
      relay_->Forward(*session_, Origin::kHost, SignalKind::kIceCandidate, message->payload);
      break;
    case HostInbound::kUnknown:
      break;
  }
  return true;
}

void HostConnection::OnClose() {
  if (closed_) {
    return;
  }
  closed_ = true;
  if (!session_) {
    return;
  }
  // 세션이 해체되는 유일한 경로.
  registry_->Remove(session_->Id());
  session_->TearDown();
  if (observability_) {
    observability_->LogEvent(LogLevel::kInfo, "session.closed", session_->Id());
  }
  session_.reset();
}

}  // namespace quickfs
