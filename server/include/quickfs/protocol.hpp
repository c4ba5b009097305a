/*
 * 설명: 시그널링 메시지 엔벨로프({type, payload})와 방향별 메시지 종류를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace quickfs {

namespace msg {
inline constexpr std::string_view kUploadCreated = "upload_created";
inline constexpr std::string_view kGetReceivers = "get_receivers";
inline constexpr std::string_view kReceiversUpdate = "receivers_update";
inline constexpr std::string_view kJoinRequest = "join_request";
inline constexpr std::string_view kFileMetadata = "file_metadata";
inline constexpr std::string_view kWebrtcOffer = "webrtc_offer";
inline constexpr std::string_view kWebrtcAnswer = "webrtc_answer";
inline constexpr std::string_view kWebrtcIceCandidate = "webrtc_ice_candidate";
}  // namespace msg

// 호스트가 보낼 수 있는 메시지 종류. 나머지는 모두 kUnknown으로 무시한다.
enum class HostInbound { kGetReceivers, kOffer, kAnswer, kIceCandidate, kUnknown };

// 수신자가 보낼 수 있는 메시지 종류.
enum class ReceiverInbound { kJoinRequest, kAnswer, kIceCandidate, kUnknown };

// 릴레이가 중계하는 핸드셰이크 메시지 종류.
enum class SignalKind { kOffer, kAnswer, kIceCandidate };

struct InboundMessage {
  std::string type;
  nlohmann::json payload;
};

// JSON 객체가 아니면 nullopt(손상된 프레임). type이 없거나 문자열이 아니면 빈 문자열로 둔다.
std::optional<InboundMessage> ParseInboundMessage(std::string_view text);

HostInbound ClassifyHostMessage(std::string_view type);
ReceiverInbound ClassifyReceiverMessage(std::string_view type);

std::string_view SignalTypeName(SignalKind kind);

std::string MakeSignalMessage(std::string_view type, const nlohmann::json& payload);

}  // namespace quickfs
