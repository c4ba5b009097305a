/*
 * 설명: 구조화 로그와 요청/연결/중계 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace quickfs {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

// 알 수 없는 이름은 kInfo로 처리한다.
LogLevel ParseLogLevel(std::string_view name);
std::string_view LogLevelName(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<std::string> session_id;
  std::optional<std::string> receiver_id;
  std::string name;
  long latency_ms{0};
  LogLevel level{LogLevel::kInfo};
  std::optional<std::string> detail;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t active_sessions{0};
  std::uint64_t relayed_messages{0};
  std::uint64_t dropped_messages{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void WebsocketOpened();
  void WebsocketClosed();
  void IncrementRelayed();
  void IncrementDropped();
  MetricsSnapshot Snapshot(std::uint64_t active_sessions) const;

  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;
  // 세션/수신자 이벤트용 단축 로그.
  void LogEvent(LogLevel level, std::string name, std::optional<std::string> session_id,
                std::optional<std::string> receiver_id = std::nullopt,
                std::optional<std::string> detail = std::nullopt) const;

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> relayed_messages_{0};
  std::atomic<std::uint64_t> dropped_messages_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace quickfs
