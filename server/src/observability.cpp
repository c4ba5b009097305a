/*
 * 설명: 구조화 로그와 요청/연결/중계 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "quickfs/observability.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

namespace quickfs {

LogLevel ParseLogLevel(std::string_view name) {
  if (name == "debug") {
    return LogLevel::kDebug;
  }
  if (name == "warn" || name == "warning") {
    return LogLevel::kWarn;
  }
  if (name == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::WebsocketOpened() { websocket_active_.fetch_add(1); }

void Observability::WebsocketClosed() { websocket_active_.fetch_sub(1); }

void Observability::IncrementRelayed() { relayed_messages_.fetch_add(1); }

void Observability::IncrementDropped() { dropped_messages_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot(std::uint64_t active_sessions) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.active_sessions = active_sessions;
  snapshot.relayed_messages = relayed_messages_.load();
  snapshot.dropped_messages = dropped_messages_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = LogLevelName(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.session_id) {
    log_json["sessionId"] = *ctx.session_id;
  }
  if (ctx.receiver_id) {
    log_json["receiverId"] = *ctx.receiver_id;
  }
  if (ctx.detail) {
    log_json["detail"] = *ctx.detail;
  }
  // 사용자 입력(파일명, 표시 이름)이 섞일 수 있으므로 잘못된 UTF-8은 치환한다.
  std::cout << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

void Observability::LogEvent(LogLevel level, std::string name, std::optional<std::string> session_id,
                             std::optional<std::string> receiver_id, std::optional<std::string> detail) const {
  if (!Enabled(level)) {
    return;
  }
  LogContext ctx;
  ctx.name = std::move(name);
  ctx.level = level;
  ctx.session_id = std::move(session_id);
  ctx.receiver_id = std::move(receiver_id);
  ctx.detail = std::move(detail);
  Log(ctx);
}

}  // namespace quickfs
