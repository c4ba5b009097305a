/*
 * 설명: HTTP 요청을 분기하고 업로드/참여 요청을 검증한 뒤 WebSocket으로 업그레이드한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/signaling_flow_it_test.cpp
 */
#include "quickfs/http_session.hpp"

#include <boost/beast/version.hpp>

#include "quickfs/api_response.hpp"
#include "quickfs/host_connection.hpp"
#include "quickfs/receiver_connection.hpp"
#include "quickfs/upload_request.hpp"
#include "quickfs/websocket_session.hpp"

namespace quickfs {

namespace {
constexpr char kServerName[] = "quickfs-relay";
constexpr std::string_view kJoinPrefix = "/api/join/";
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<SessionRegistry> registry, std::shared_ptr<SignalingRelay> relay,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), registry_(std::move(registry)), relay_(std::move(relay)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  if (observability_) {
    observability_->IncrementRequest();
  }

  auto target = SplitTarget(std::string_view(req_.target().data(), req_.target().size()));
  const auto& path = target.path;

  if (req_.method() != http::verb::get) {
    return SendError(http::status::not_found, "not_found", "지원되지 않는 경로입니다");
  }

  if (path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
    return SendJson(http::status::ok, MakeSuccessEnvelope(payload));
  }

  if (path == "/metrics") {
    auto snapshot = observability_->Snapshot(registry_->ActiveCount());
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"connections", {{"websocket", snapshot.websocket_active}}},
                        {"sessions", {{"active", snapshot.active_sessions}}},
                        {"relay", {{"relayed", snapshot.relayed_messages}, {"dropped", snapshot.dropped_messages}}}};
    return SendJson(http::status::ok, MakeSuccessEnvelope(data));
  }

  if (path == "/api/upload") {
    return HandleUpload(target.query);
  }

  if (path.size() > kJoinPrefix.size() && path.compare(0, kJoinPrefix.size(), kJoinPrefix) == 0) {
    auto session_id = path.substr(kJoinPrefix.size());
    if (session_id.find('/') == std::string::npos) {
      return HandleJoin(session_id);
    }
  }

  SendError(http::status::not_found, "not_found", "지원되지 않는 경로입니다");
}

void HttpSession::HandleUpload(const std::string& query) {
  using boost::beast::http::status;
  UploadRequestError error;
  auto metadata = ParseUploadQuery(query, error);
  if (!metadata) {
    return SendError(status::bad_request, error.code, error.message);
  }
  if (!boost::beast::websocket::is_upgrade(req_)) {
    return SendError(status::bad_request, "upgrade_required", "WebSocket 업그레이드 요청이 아닙니다");
  }
  // 세션은 업그레이드가 성공한 뒤 HostConnection::OnOpen에서 만들어진다.
  UpgradeTo(std::make_unique<HostConnection>(std::move(*metadata), registry_, relay_, observability_));
}

void HttpSession::HandleJoin(const std::string& session_id) {
  using boost::beast::http::status;
  auto session = registry_->Lookup(session_id);
  if (!session) {
    return SendError(status::not_found, "upload_not_found", "업로드 세션을 찾을 수 없습니다");
  }
  if (!boost::beast::websocket::is_upgrade(req_)) {
    return SendError(status::bad_request, "upgrade_required", "WebSocket 업그레이드 요청이 아닙니다");
  }
  UpgradeTo(std::make_unique<ReceiverConnection>(std::move(session), relay_, observability_));
}

void HttpSession::SendJson(boost::beast::http::status status, const nlohmann::json& body) {
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->result(status);
  res->set(boost::beast::http::field::server, kServerName);
  res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
  res->body() = body.dump();
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::SendError(boost::beast::http::status status, std::string_view code, std::string_view message) {
  SendJson(status, MakeErrorEnvelope(code, message));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    LogContext ctx;
    ctx.trace_id = trace_id_;
    ctx.name = "http.request";
    ctx.latency_ms = latency;
    ctx.detail = std::string(req_.target()) + " " + std::to_string(res->result_int());
    observability_->Log(ctx);
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

void HttpSession::UpgradeTo(std::unique_ptr<ConnectionHandler> handler) {
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  // tcp_stream 타이머는 끄고 WebSocket 자체 타임아웃을 쓴다. 호스트는 수신자를 오래 기다릴 수 있으므로 핑을 켠다.
  boost::beast::get_lowest_layer(ws).expires_never();
  auto timeouts = boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server);
  timeouts.keep_alive_pings = true;
  ws.set_option(timeouts);
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, kServerName);
  }));
  boost::beast::error_code ec;
  ws.accept(req_, ec);
  if (ec) {
    // 핸드셰이크 실패. 세션/수신자 상태는 아직 만들어지지 않았다.
    if (observability_) {
      observability_->IncrementError();
      observability_->LogEvent(LogLevel::kWarn, "ws.upgrade_failed", std::nullopt, std::nullopt, ec.message());
    }
    boost::beast::error_code ignored;
    ws.next_layer().socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    return;
  }
  if (observability_) {
    LogContext ctx;
    ctx.trace_id = trace_id_;
    ctx.name = "http.request";
    ctx.latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                          request_start_)
                         .count();
    ctx.detail = std::string(req_.target()) + " 101";
    observability_->Log(ctx);
  }
  std::make_shared<WebSocketSession>(std::move(ws), std::move(handler), observability_,
                                     config_.ws_queue_limit_messages, config_.ws_queue_limit_bytes)
      ->Run();
}

}  // namespace quickfs
