/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace quickfs {

struct AppConfig {
  unsigned short port{3000};
  std::size_t worker_threads{0};
  std::string log_level{"info"};
  std::size_t ws_queue_limit_messages{256};
  std::size_t ws_queue_limit_bytes{1 << 20};
};

AppConfig LoadConfigFromEnv();

}  // namespace quickfs
