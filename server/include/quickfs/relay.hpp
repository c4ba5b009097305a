/*
 * 설명: 호스트와 수신자 사이의 WebRTC 핸드셰이크 메시지를 중계하고 멤버십 알림을 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/relay_test.cpp
 */
#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "quickfs/observability.hpp"
#include "quickfs/protocol.hpp"
#include "quickfs/session.hpp"

namespace quickfs {

inline constexpr std::string_view kHostPeerId = "host";

enum class Origin { kHost, kReceiver };

enum class RelayOutcome {
  kDelivered,
  kDropped,  // 대상 수신자가 없음(이미 떠났거나 잘못된 id)
  kIgnored,  // 해당 방향에서는 의미 없는 메시지
};

class SignalingRelay {
 public:
  explicit SignalingRelay(std::shared_ptr<Observability> observability);

  // origin == kReceiver이면 sender_receiver_id가 발신 수신자의 id다. 페이로드의 자기 신고 값은 믿지 않는다.
  RelayOutcome Forward(const Session& session, Origin origin, SignalKind kind, const nlohmann::json& payload,
                       const std::string& sender_receiver_id = {}) const;

  // 현재 수신자 목록을 receivers_update로 호스트에게 보낸다. 0번 원소가 활성 수신자다.
  void NotifyMembership(const Session& session) const;

  static nlohmann::json BuildMembershipPayload(const std::vector<ReceiverView>& receivers);

 private:
  RelayOutcome RelayOffer(const Session& session, Origin origin, const nlohmann::json& payload) const;
  RelayOutcome RelayAnswer(const Session& session, Origin origin, const nlohmann::json& payload,
                           const std::string& sender_receiver_id) const;
  RelayOutcome RelayCandidate(const Session& session, Origin origin, const nlohmann::json& payload,
                              const std::string& sender_receiver_id) const;
  RelayOutcome DeliverToReceiver(const Session& session, const std::string& receiver_id, SignalKind kind,
                                 const nlohmann::json& payload) const;
  RelayOutcome DeliverToHost(const Session& session, SignalKind kind, const nlohmann::json& payload) const;

  std::shared_ptr<Observability> observability_;
};

}  // namespace quickfs
