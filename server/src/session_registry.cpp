/*
 * 설명: 세션 생성(식별자 충돌 재시도), 조회, 제거를 동시성 안전하게 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_registry_test.cpp
 */
#include "quickfs/session_registry.hpp"

#include <chrono>
#include <mutex>
#include <stdexcept>

#include "quickfs/id_generator.hpp"

namespace quickfs {

SessionRegistry::SessionRegistry() : id_generator_(&GenerateSessionId) {}

void SessionRegistry::SetIdGenerator(std::function<std::string()> generator) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  id_generator_ = std::move(generator);
}

std::shared_ptr<Session> SessionRegistry::Create(const FileMetadata& metadata,
                                                 std::shared_ptr<SignalingChannel> host_channel) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  for (std::size_t attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
    auto id = id_generator_();
    if (sessions_.count(id) > 0) {
      continue;
    }
    // 완전히 구성된 뒤에만 맵에 넣는다.
    auto session = std::make_shared<Session>(id, metadata, std::move(host_channel), std::chrono::system_clock::now());
    sessions_.emplace(std::move(id), session);
    return session;
  }
  throw std::runtime_error("세션 식별자 생성 재시도 한도를 초과했습니다");
}

std::shared_ptr<Session> SessionRegistry::Lookup(const std::string& session_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  return it->second;
}

bool SessionRegistry::Remove(const std::string& session_id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return sessions_.erase(session_id) > 0;
}

std::size_t SessionRegistry::ActiveCount() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return sessions_.size();
}

}  // namespace quickfs
