/*
 * 설명: 세션의 수신자 목록을 읽기/쓰기 잠금으로 보호하며 조회/변경한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_test.cpp
 */
#include "quickfs/session.hpp"

#include <algorithm>
#include <mutex>

namespace quickfs {

Session::Session(std::string id, FileMetadata metadata, std::shared_ptr<SignalingChannel> host_channel,
                 std::chrono::system_clock::time_point created_at)
    : id_(std::move(id)), metadata_(std::move(metadata)), created_at_(created_at),
      host_channel_(std::move(host_channel)) {}

SessionState Session::State() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return state_;
}

std::shared_ptr<SignalingChannel> Session::HostChannel() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return host_channel_.lock();
}

void Session::AddReceiver(Receiver receiver) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  receivers_.push_back(std::move(receiver));
}

bool Session::RemoveReceiver(const std::string& receiver_id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = std::find_if(receivers_.begin(), receivers_.end(),
                         [&receiver_id](const Receiver& r) { return r.id == receiver_id; });
  if (it == receivers_.end()) {
    return false;
  }
  receivers_.erase(it);
  return true;
}

std::shared_ptr<SignalingChannel> Session::FindReceiverChannel(const std::string& receiver_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  for (const auto& r : receivers_) {
    if (r.id == receiver_id) {
      return r.channel.lock();
    }
  }
  return nullptr;
}

std::vector<ReceiverView> Session::SnapshotReceivers() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<ReceiverView> views;
  views.reserve(receivers_.size());
  for (const auto& r : receivers_) {
    views.push_back(ReceiverView{r.id, r.name, r.public_key, r.connected_at});
  }
  return views;
}

std::optional<std::string> Session::ActiveReceiverId() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (receivers_.empty()) {
    return std::nullopt;
  }
  return receivers_.front().id;
}

std::size_t Session::ReceiverCount() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return receivers_.size();
}

void Session::TearDown() {
  std::shared_ptr<SignalingChannel> host;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (state_ == SessionState::kTornDown) {
      return;
    }
    state_ = SessionState::kTornDown;
    host = host_channel_.lock();
    host_channel_.reset();
  }
  // 잠금을 놓은 뒤 닫는다.
  if (host) {
    host->Close();
  }
}

}  // namespace quickfs
