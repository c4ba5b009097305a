/*
 * 설명: 세션/수신자 식별자로 쓰이는 암호학적 난수 16진 문자열을 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_registry_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace quickfs {

inline constexpr std::size_t kSessionIdBytes = 4;
inline constexpr std::size_t kReceiverIdBytes = 8;

// RAND_bytes 실패 시 std::runtime_error를 던진다.
std::string RandomHex(std::size_t bytes);

std::string GenerateSessionId();
std::string GenerateReceiverId();

}  // namespace quickfs
