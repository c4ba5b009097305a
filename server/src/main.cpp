/*
 * 설명: 시그널링 릴레이 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include <exception>
#include <iostream>

#include "quickfs/app.hpp"

int main() {
  using namespace quickfs;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::exception& ex) {
    std::cerr << "환경설정 값이 올바르지 않습니다: " << ex.what() << "\n";
    return 1;
  }
  ServerApp app(config);
  return app.Run() ? 0 : 1;
}
