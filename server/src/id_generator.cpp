/*
 * 설명: OpenSSL 난수로 세션/수신자 식별자를 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_registry_test.cpp
 */
#include "quickfs/id_generator.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/rand.h>

namespace quickfs {

namespace {
std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}
}  // namespace

std::string RandomHex(std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return BytesToHex(buffer.data(), buffer.size());
}

std::string GenerateSessionId() { return RandomHex(kSessionIdBytes); }

std::string GenerateReceiverId() { return RandomHex(kReceiverIdBytes); }

}  // namespace quickfs
