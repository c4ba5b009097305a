/*
 * 설명: 수신자 연결의 join_request 검증, 세션 등록, 메시지 중계, 이탈 정리를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_handler_test.cpp, server/tests/it/signaling_flow_it_test.cpp
 */
#include "quickfs/receiver_connection.hpp"

#include <chrono>

#include "quickfs/id_generator.hpp"
#include "quickfs/protocol.hpp"

namespace quickfs {

namespace {
std::string OptionalString(const nlohmann::json& payload, const char* key) {
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}
}  // namespace

ReceiverConnection::ReceiverConnection(std::shared_ptr<Session> session, std::shared_ptr<SignalingRelay> relay,
                                       std::shared_ptr<Observability> observability)
    : session_(std::move(session)), relay_(std::move(relay)), observability_(std::move(observability)) {}

void ReceiverConnection::OnOpen(const std::shared_ptr<SignalingChannel>& channel) {
  channel_ = channel;
  state_ = State::kJoinPending;
}

bool ReceiverConnection::OnMessage(std::string_view text) {
  switch (state_) {
    case State::kJoinPending:
      return HandleJoin(text);
    case State::kJoined: {
      auto message = ParseInboundMessage(text);
      if (!message) {
        return false;
      }
      HandleJoined(*message);
      return true;
    }
    case State::kConnected:
    case State::kClosed:
      return false;
  }
  return false;
}

bool ReceiverConnection::HandleJoin(std::string_view text) {
  auto message = ParseInboundMessage(text);
  auto channel = channel_.lock();
  if (!message || ClassifyReceiverMessage(message->type) != ReceiverInbound::kJoinRequest ||
      !message->payload.is_object() || !channel) {
    if (observability_) {
      observability_->LogEvent(LogLevel::kWarn, "receiver.join_rejected", session_->Id(), std::nullopt,
                               message ? "unexpected type: " + message->type : std::string("malformed frame"));
    }
    return false;
  }

  receiver_id_ = GenerateReceiverId();
  name_ = OptionalString(message->payload, "name");
  Receiver receiver{receiver_id_, name_, OptionalString(message->payload, "public_key"), channel,
                    std::chrono::system_clock::now()};
  session_->AddReceiver(std::move(receiver));
  state_ = State::kJoined;
  if (observability_) {
    observability_->LogEvent(LogLevel::kInfo, "receiver.joined", session_->Id(), receiver_id_, name_);
  }

  const auto& meta = session_->Metadata();
  channel->Send(MakeSignalMessage(
      msg::kFileMetadata, {{"filename", meta.filename}, {"filetype", meta.filetype}, {"filesize", meta.filesize}}));
  relay_->NotifyMembership(*session_);
  return true;
}

void ReceiverConnection::HandleJoined(const InboundMessage& message) {
  switch (ClassifyReceiverMessage(message.type)) {
    case ReceiverInbound::kAnswer:
      relay_->Forward(*session_, Origin::kReceiver, SignalKind::kAnswer, message.payload, receiver_id_);
      break;
    case ReceiverInbound::kIceCandidate:
      relay_->Forward(*session_, Origin::kReceiver, SignalKind::kIceCandidate, message.payload, receiver_id_);
      break;
    case ReceiverInbound::kJoinRequest:
    case ReceiverInbound::kUnknown:
      if (observability_) {
        observability_->LogEvent(LogLevel::kDebug, "receiver.ignored", session_->Id(), receiver_id_, message.type);
      }
      break;
  }
}

void ReceiverConnection::OnClose() {
  if (state_ == State::kClosed) {
    return;
  }
  const bool was_joined = state_ == State::kJoined;
  state_ = State::kClosed;
  if (was_joined) {
    session_->RemoveReceiver(receiver_id_);
  }
  if (auto channel = channel_.lock()) {
    channel->Close();
  }
  if (was_joined) {
    relay_->NotifyMembership(*session_);
    if (observability_) {
      observability_->LogEvent(LogLevel::kInfo, "receiver.left", session_->Id(), receiver_id_, name_);
    }
  }
}

}  // namespace quickfs
