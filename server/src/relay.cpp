/*
 * 설명: 핸드셰이크 메시지에 라우팅 태그를 붙여 상대편 채널로 전달하고 멤버십 알림을 보낸다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/relay_test.cpp
 */
#include "quickfs/relay.hpp"

#include "quickfs/api_response.hpp"

namespace quickfs {

namespace {
// 페이로드 본문은 해석하지 않는다. 라우팅 필드만 읽는다.
std::string RoutingField(const nlohmann::json& payload, const char* key) {
  if (!payload.is_object()) {
    return {};
  }
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

nlohmann::json OpaqueBody(const nlohmann::json& payload, const char* key) {
  if (!payload.is_object()) {
    return nullptr;
  }
  auto it = payload.find(key);
  if (it == payload.end()) {
    return nullptr;
  }
  return *it;
}
}  // namespace

SignalingRelay::SignalingRelay(std::shared_ptr<Observability> observability)
    : observability_(std::move(observability)) {}

RelayOutcome SignalingRelay::Forward(const Session& session, Origin origin, SignalKind kind,
                                     const nlohmann::json& payload, const std::string& sender_receiver_id) const {
  switch (kind) {
    case SignalKind::kOffer:
      return RelayOffer(session, origin, payload);
    case SignalKind::kAnswer:
      return RelayAnswer(session, origin, payload, sender_receiver_id);
    case SignalKind::kIceCandidate:
      return RelayCandidate(session, origin, payload, sender_receiver_id);
  }
  return RelayOutcome::kIgnored;
}

RelayOutcome SignalingRelay::RelayOffer(const Session& session, Origin origin, const nlohmann::json& payload) const {
  if (origin != Origin::kHost) {
    return RelayOutcome::kIgnored;
  }
  nlohmann::json forwarded{{"sender_id", kHostPeerId}, {"offer", OpaqueBody(payload, "offer")}};
  return DeliverToReceiver(session, RoutingField(payload, "receiver_id"), SignalKind::kOffer, forwarded);
}

RelayOutcome SignalingRelay::RelayAnswer(const Session& session, Origin origin, const nlohmann::json& payload,
                                         const std::string& sender_receiver_id) const {
  if (origin != Origin::kReceiver) {
    return RelayOutcome::kIgnored;
  }
  nlohmann::json forwarded{{"receiver_id", sender_receiver_id}, {"answer", OpaqueBody(payload, "answer")}};
  return DeliverToHost(session, SignalKind::kAnswer, forwarded);
}

RelayOutcome SignalingRelay::RelayCandidate(const Session& session, Origin origin, const nlohmann::json& payload,
                                            const std::string& sender_receiver_id) const {
  auto candidate = OpaqueBody(payload, "candidate");
  if (origin == Origin::kHost) {
    nlohmann::json forwarded{{"peer_id", kHostPeerId}, {"candidate", candidate}};
    return DeliverToReceiver(session, RoutingField(payload, "peer_id"), SignalKind::kIceCandidate, forwarded);
  }
  nlohmann::json forwarded{{"peer_id", sender_receiver_id}, {"candidate", candidate}};
  return DeliverToHost(session, SignalKind::kIceCandidate, forwarded);
}

RelayOutcome SignalingRelay::DeliverToReceiver(const Session& session, const std::string& receiver_id,
                                               SignalKind kind, const nlohmann::json& payload) const {
  std::shared_ptr<SignalingChannel> target;
  if (!receiver_id.empty()) {
    target = session.FindReceiverChannel(receiver_id);
  }
  if (!target) {
    if (observability_) {
      observability_->IncrementDropped();
      observability_->LogEvent(LogLevel::kDebug, "relay.dropped", session.Id(), receiver_id,
                               std::string(SignalTypeName(kind)));
    }
    return RelayOutcome::kDropped;
  }
  target->Send(MakeSignalMessage(SignalTypeName(kind), payload));
  if (observability_) {
    observability_->IncrementRelayed();
  }
  return RelayOutcome::kDelivered;
}

RelayOutcome SignalingRelay::DeliverToHost(const Session& session, SignalKind kind,
                                           const nlohmann::json& payload) const {
  auto host = session.HostChannel();
  if (!host) {
    if (observability_) {
      observability_->IncrementDropped();
      observability_->LogEvent(LogLevel::kDebug, "relay.dropped", session.Id(), std::nullopt,
                               std::string(SignalTypeName(kind)));
    }
    return RelayOutcome::kDropped;
  }
  host->Send(MakeSignalMessage(SignalTypeName(kind), payload));
  if (observability_) {
    observability_->IncrementRelayed();
  }
  return RelayOutcome::kDelivered;
}

nlohmann::json SignalingRelay::BuildMembershipPayload(const std::vector<ReceiverView>& receivers) {
  nlohmann::json list = nlohmann::json::array();
  for (const auto& r : receivers) {
    list.push_back({{"id", r.id},
                    {"name", r.name},
                    {"public_key", r.public_key},
                    {"connected_at", ToIsoString(r.connected_at)}});
  }
  return list;
}

void SignalingRelay::NotifyMembership(const Session& session) const {
  // 스냅샷은 읽기 잠금 안에서 복사되고, 전송은 잠금 밖에서 한다.
  auto snapshot = session.SnapshotReceivers();
  auto host = session.HostChannel();
  if (!host) {
    return;
  }
  host->Send(MakeSignalMessage(msg::kReceiversUpdate, BuildMembershipPayload(snapshot)));
}

}  // namespace quickfs
