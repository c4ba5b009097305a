/*
 * 설명: 호스트 한 명의 파일 공유 세션과 참여한 수신자 목록을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "quickfs/signaling_channel.hpp"

namespace quickfs {

struct FileMetadata {
  std::string filename;
  std::string filetype;
  std::int64_t filesize{0};
};

struct Receiver {
  std::string id;
  std::string name;
  std::string public_key;
  // 연결은 자신의 비동기 작업이 붙잡고 있다. 세션은 관찰만 한다.
  std::weak_ptr<SignalingChannel> channel;
  std::chrono::system_clock::time_point connected_at;
};

// 호스트에게 보여줄 수 있는 수신자 필드만 담는다.
struct ReceiverView {
  std::string id;
  std::string name;
  std::string public_key;
  std::chrono::system_clock::time_point connected_at;
};

enum class SessionState { kActive, kTornDown };

class Session {
 public:
  Session(std::string id, FileMetadata metadata, std::shared_ptr<SignalingChannel> host_channel,
          std::chrono::system_clock::time_point created_at);

  const std::string& Id() const { return id_; }
  const FileMetadata& Metadata() const { return metadata_; }
  std::chrono::system_clock::time_point CreatedAt() const { return created_at_; }

  SessionState State() const;
  std::shared_ptr<SignalingChannel> HostChannel() const;

  void AddReceiver(Receiver receiver);
  bool RemoveReceiver(const std::string& receiver_id);
  std::shared_ptr<SignalingChannel> FindReceiverChannel(const std::string& receiver_id) const;
  std::vector<ReceiverView> SnapshotReceivers() const;
  std::optional<std::string> ActiveReceiverId() const;
  std::size_t ReceiverCount() const;

  void TearDown();

 private:
  const std::string id_;
  const FileMetadata metadata_;
  const std::chrono::system_clock::time_point created_at_;
  std::weak_ptr<SignalingChannel> host_channel_;
  std::vector<Receiver> receivers_;
  SessionState state_{SessionState::kActive};
  mutable std::shared_mutex mutex_;
};

}  // namespace quickfs
