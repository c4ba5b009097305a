/*
 * 설명: 살아있는 세션을 식별자로 보관하는 프로세스 단위 레지스트리.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_registry_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "quickfs/session.hpp"
#include "quickfs/signaling_channel.hpp"

namespace quickfs {

class SessionRegistry {
 public:
  static constexpr std::size_t kMaxIdAttempts = 16;

  SessionRegistry();

  // 충돌 테스트용으로 식별자 생성기를 교체한다.
  void SetIdGenerator(std::function<std::string()> generator);

  std::shared_ptr<Session> Create(const FileMetadata& metadata, std::shared_ptr<SignalingChannel> host_channel);
  std::shared_ptr<Session> Lookup(const std::string& session_id) const;
  bool Remove(const std::string& session_id);
  std::size_t ActiveCount() const;

 private:
  std::function<std::string()> id_generator_;
  std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
  mutable std::shared_mutex mutex_;
};

}  // namespace quickfs
