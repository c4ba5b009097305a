/*
 * 설명: 시그널링 엔벨로프를 파싱/직렬화하고 메시지 종류를 분류한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_test.cpp
 */
#include "quickfs/protocol.hpp"

namespace quickfs {

std::optional<InboundMessage> ParseInboundMessage(std::string_view text) {
  auto parsed = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return std::nullopt;
  }
  InboundMessage message;
  auto type_it = parsed.find("type");
  if (type_it != parsed.end() && type_it->is_string()) {
    message.type = type_it->get<std::string>();
  }
  auto payload_it = parsed.find("payload");
  if (payload_it != parsed.end()) {
    message.payload = std::move(*payload_it);
  }
  return message;
}

HostInbound ClassifyHostMessage(std::string_view type) {
  if (type == msg::kGetReceivers) {
    return HostInbound::kGetReceivers;
  }
  if (type == msg::kWebrtcOffer) {
    return HostInbound::kOffer;
  }
  if (type == msg::kWebrtcAnswer) {
    return HostInbound::kAnswer;
  }
  if (type == msg::kWebrtcIceCandidate) {
    return HostInbound::kIceCandidate;
  }
  return HostInbound::kUnknown;
}

ReceiverInbound ClassifyReceiverMessage(std::string_view type) {
  if (type == msg::kJoinRequest) {
    return ReceiverInbound::kJoinRequest;
  }
  if (type == msg::kWebrtcAnswer) {
    return ReceiverInbound::kAnswer;
  }
  if (type == msg::kWebrtcIceCandidate) {
    return ReceiverInbound::kIceCandidate;
  }
  return ReceiverInbound::kUnknown;
}

std::string_view SignalTypeName(SignalKind kind) {
  switch (kind) {
    case SignalKind::kOffer:
      return msg::kWebrtcOffer;
    case SignalKind::kAnswer:
      return msg::kWebrtcAnswer;
    case SignalKind::kIceCandidate:
      return msg::kWebrtcIceCandidate;
  }
  return {};
}

std::string MakeSignalMessage(std::string_view type, const nlohmann::json& payload) {
  nlohmann::json envelope;
  envelope["type"] = type;
  envelope["payload"] = payload;
  return envelope.dump();
}

}  // namespace quickfs
