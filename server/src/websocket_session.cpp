/*
 * 설명: WebSocket 메시지를 읽어 핸들러로 넘기고, 스트랜드 위 송신 큐로 메시지를 내보낸다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/signaling_flow_it_test.cpp
 */
#include "quickfs/websocket_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

namespace quickfs {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   std::unique_ptr<ConnectionHandler> handler,
                                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                                   std::size_t max_queue_bytes)
    : ws_(std::move(ws)), handler_(std::move(handler)), observability_(std::move(observability)),
      max_queue_messages_(max_queue_messages), max_queue_bytes_(max_queue_bytes) {}

WebSocketSession::~WebSocketSession() {
  // io_context 종료 중에 파괴되는 경우. 핸들러 정리는 하지 않고 카운터만 맞춘다.
  if (!finished_ && observability_) {
    observability_->WebsocketClosed();
  }
}

void WebSocketSession::Run() {
  if (observability_) {
    observability_->WebsocketOpened();
  }
  ws_.read_message_max(max_queue_bytes_);
  try {
    handler_->OnOpen(shared_from_this());
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->LogEvent(LogLevel::kError, "ws.open_failed", std::nullopt, std::nullopt, ex.what());
    }
    StartClose(boost::beast::websocket::close_reason{boost::beast::websocket::close_code::internal_error});
    Finish();
    return;
  }
  DoRead();
}

void WebSocketSession::Send(std::string message) {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), message = std::move(message)]() mutable {
    self->EnqueueMessage(std::move(message));
  });
}

void WebSocketSession::Close() {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this()]() {
    self->StartClose(boost::beast::websocket::close_reason{boost::beast::websocket::close_code::normal});
  });
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  // 닫힘, 손상된 프레임, 소켓 오류 모두 상대가 떠난 것으로 본다.
  if (ec || closing_) {
    Finish();
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  bool keep_open = false;
  try {
    keep_open = handler_->OnMessage(data);
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->LogEvent(LogLevel::kError, "ws.handler_failed", std::nullopt, std::nullopt, ex.what());
    }
  }
  if (!keep_open) {
    StartClose(boost::beast::websocket::close_reason{boost::beast::websocket::close_code::normal});
    Finish();
    return;
  }
  DoRead();
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    closing_ = true;
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::StartClose(boost::beast::websocket::close_reason reason) {
  if (closing_) {
    return;
  }
  closing_ = true;
  if (!writing_) {
    send_queue_.clear();
    queued_bytes_ = 0;
  }
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) {});
}

void WebSocketSession::TriggerBackpressureClose() {
  if (closing_) {
    return;
  }
  if (observability_) {
    observability_->LogEvent(LogLevel::kWarn, "ws.backpressure", std::nullopt, std::nullopt,
                             std::to_string(send_queue_.size()) + " queued");
  }
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  StartClose(reason);
}

void WebSocketSession::Finish() {
  if (finished_) {
    return;
  }
  finished_ = true;
  if (observability_) {
    observability_->WebsocketClosed();
  }
  try {
    handler_->OnClose();
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->LogEvent(LogLevel::kError, "ws.close_failed", std::nullopt, std::nullopt, ex.what());
    }
  }
}

}  // namespace quickfs
