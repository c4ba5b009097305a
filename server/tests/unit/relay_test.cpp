#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "quickfs/relay.hpp"
#include "unit/fake_channel.hpp"

namespace {

using quickfs::Origin;
using quickfs::RelayOutcome;
using quickfs::SignalKind;
using quickfs::testing::FakeChannel;

class RelayTest : public ::testing::Test {
 protected:
  void SetUp() override {
    observability_ = std::make_shared<quickfs::Observability>(quickfs::LogLevel::kError);
    relay_ = std::make_shared<quickfs::SignalingRelay>(observability_);
    host_ = std::make_shared<FakeChannel>();
    session_ = std::make_shared<quickfs::Session>("ab12cd34", quickfs::FileMetadata{"report.pdf", "application/pdf", 2048},
                                                  host_, std::chrono::system_clock::now());
    r1_ = Join("r1", "Alex");
    r2_ = Join("r2", "Sam");
  }

  std::shared_ptr<FakeChannel> Join(const std::string& id, const std::string& name) {
    auto channel = std::make_shared<FakeChannel>();
    session_->AddReceiver(quickfs::Receiver{id, name, "", channel, std::chrono::system_clock::now()});
    return channel;
  }

  std::shared_ptr<quickfs::Observability> observability_;
  std::shared_ptr<quickfs::SignalingRelay> relay_;
  std::shared_ptr<FakeChannel> host_;
  std::shared_ptr<quickfs::Session> session_;
  std::shared_ptr<FakeChannel> r1_;
  std::shared_ptr<FakeChannel> r2_;
};

TEST_F(RelayTest, HostOfferReachesNamedReceiverOnly) {
  nlohmann::json offer{{"type", "offer"}, {"sdp", "v=0\r\no=- 1 2 IN IP4 0.0.0.0"}};
  auto outcome = relay_->Forward(*session_, Origin::kHost, SignalKind::kOffer, {{"receiver_id", "r2"}, {"offer", offer}});
  EXPECT_EQ(outcome, RelayOutcome::kDelivered);

  ASSERT_EQ(r2_->SentCount(), 1u);
  auto delivered = r2_->Last();
  EXPECT_EQ(delivered["type"], "webrtc_offer");
  EXPECT_EQ(delivered["payload"]["sender_id"], "host");
  EXPECT_EQ(delivered["payload"]["offer"], offer);
  EXPECT_EQ(r1_->SentCount(), 0u);
  EXPECT_EQ(host_->SentCount(), 0u);
}

TEST_F(RelayTest, OfferToAbsentReceiverIsDropped) {
  session_->RemoveReceiver("r1");
  auto outcome = relay_->Forward(*session_, Origin::kHost, SignalKind::kOffer, {{"receiver_id", "r1"}, {"offer", {}}});
  EXPECT_EQ(outcome, RelayOutcome::kDropped);
  EXPECT_EQ(r1_->SentCount(), 0u);
  EXPECT_EQ(r2_->SentCount(), 0u);
  EXPECT_EQ(host_->SentCount(), 0u);

  EXPECT_EQ(relay_->Forward(*session_, Origin::kHost, SignalKind::kOffer, {{"offer", {}}}), RelayOutcome::kDropped);
  EXPECT_EQ(relay_->Forward(*session_, Origin::kHost, SignalKind::kOffer, "r2"), RelayOutcome::kDropped);
  EXPECT_EQ(observability_->Snapshot(0).dropped_messages, 3u);
}

TEST_F(RelayTest, ReceiverOfferIsIgnored) {
  auto outcome =
      relay_->Forward(*session_, Origin::kReceiver, SignalKind::kOffer, {{"receiver_id", "r2"}, {"offer", {}}}, "r1");
  EXPECT_EQ(outcome, RelayOutcome::kIgnored);
  EXPECT_EQ(r2_->SentCount(), 0u);
  EXPECT_EQ(host_->SentCount(), 0u);
}

TEST_F(RelayTest, AnswerIsTaggedWithTrueSender) {
  nlohmann::json answer{{"type", "answer"}, {"sdp", "v=0"}};
  auto outcome = relay_->Forward(*session_, Origin::kReceiver, SignalKind::kAnswer,
                                 {{"sender_id", "r2"}, {"receiver_id", "r2"}, {"answer", answer}}, "r1");
  EXPECT_EQ(outcome, RelayOutcome::kDelivered);
  ASSERT_EQ(host_->SentCount(), 1u);
  auto delivered = host_->Last();
  EXPECT_EQ(delivered["type"], "webrtc_answer");
  EXPECT_EQ(delivered["payload"]["receiver_id"], "r1");
  EXPECT_EQ(delivered["payload"]["answer"], answer);
  EXPECT_EQ(r2_->SentCount(), 0u);
}

TEST_F(RelayTest, HostAnswerIsIgnored) {
  auto outcome = relay_->Forward(*session_, Origin::kHost, SignalKind::kAnswer, {{"answer", {}}});
  EXPECT_EQ(outcome, RelayOutcome::kIgnored);
  EXPECT_EQ(host_->SentCount(), 0u);
  EXPECT_EQ(r1_->SentCount(), 0u);
}

TEST_F(RelayTest, HostCandidateRoutesByPeerId) {
  nlohmann::json candidate{{"candidate", "candidate:1 1 udp 2122260223 10.0.0.2 54321 typ host"}, {"sdpMid", "0"}};
  auto outcome =
      relay_->Forward(*session_, Origin::kHost, SignalKind::kIceCandidate, {{"peer_id", "r1"}, {"candidate", candidate}});
  EXPECT_EQ(outcome, RelayOutcome::kDelivered);
  ASSERT_EQ(r1_->SentCount(), 1u);
  EXPECT_EQ(r1_->Last()["type"], "webrtc_ice_candidate");
  EXPECT_EQ(r1_->Last()["payload"]["peer_id"], "host");
  EXPECT_EQ(r1_->Last()["payload"]["candidate"], candidate);
  EXPECT_EQ(r2_->SentCount(), 0u);

  EXPECT_EQ(relay_->Forward(*session_, Origin::kHost, SignalKind::kIceCandidate, {{"peer_id", "gone"}, {"candidate", candidate}}),
            RelayOutcome::kDropped);
}

TEST_F(RelayTest, ReceiverCandidateAlwaysGoesToHost) {
  nlohmann::json candidate{{"candidate", "candidate:2"}};
  auto outcome = relay_->Forward(*session_, Origin::kReceiver, SignalKind::kIceCandidate,
                                 {{"peer_id", "r1"}, {"candidate", candidate}}, "r2");
  EXPECT_EQ(outcome, RelayOutcome::kDelivered);
  ASSERT_EQ(host_->SentCount(), 1u);
  EXPECT_EQ(host_->Last()["payload"]["peer_id"], "r2");
  EXPECT_EQ(host_->Last()["payload"]["candidate"], candidate);
  EXPECT_EQ(r1_->SentCount(), 0u);
}

TEST_F(RelayTest, NonObjectPayloadForwardsNullBody) {
  auto outcome = relay_->Forward(*session_, Origin::kReceiver, SignalKind::kAnswer, nlohmann::json::array({1, 2}), "r1");
  EXPECT_EQ(outcome, RelayOutcome::kDelivered);
  EXPECT_EQ(host_->Last()["payload"]["receiver_id"], "r1");
  EXPECT_TRUE(host_->Last()["payload"]["answer"].is_null());
}

TEST_F(RelayTest, MembershipListsReceiversInJoinOrder) {
  relay_->NotifyMembership(*session_);
  ASSERT_EQ(host_->SentCount(), 1u);
  auto update = host_->Last();
  EXPECT_EQ(update["type"], "receivers_update");
  ASSERT_TRUE(update["payload"].is_array());
  ASSERT_EQ(update["payload"].size(), 2u);
  EXPECT_EQ(update["payload"][0]["id"], "r1");
  EXPECT_EQ(update["payload"][0]["name"], "Alex");
  EXPECT_TRUE(update["payload"][0]["connected_at"].is_string());
  EXPECT_TRUE(update["payload"][0].contains("public_key"));
  EXPECT_FALSE(update["payload"][0].contains("channel"));
  EXPECT_EQ(update["payload"][1]["id"], "r2");
}

TEST_F(RelayTest, ActiveReceiverChangesWhenOldestLeaves) {
  session_->RemoveReceiver("r1");
  relay_->NotifyMembership(*session_);
  auto update = host_->Last();
  ASSERT_EQ(update["payload"].size(), 1u);
  EXPECT_EQ(update["payload"][0]["id"], "r2");

  session_->RemoveReceiver("r2");
  relay_->NotifyMembership(*session_);
  EXPECT_TRUE(host_->Last()["payload"].empty());
}

TEST_F(RelayTest, NothingReachesHostAfterTearDown) {
  session_->TearDown();
  auto outcome = relay_->Forward(*session_, Origin::kReceiver, SignalKind::kAnswer, {{"answer", {}}}, "r1");
  EXPECT_EQ(outcome, RelayOutcome::kDropped);
  relay_->NotifyMembership(*session_);
  EXPECT_EQ(host_->SentCount(), 0u);
}

TEST_F(RelayTest, CountsRelayedMessages) {
  relay_->Forward(*session_, Origin::kHost, SignalKind::kOffer, {{"receiver_id", "r1"}, {"offer", {}}});
  relay_->Forward(*session_, Origin::kReceiver, SignalKind::kAnswer, {{"answer", {}}}, "r1");
  auto snapshot = observability_->Snapshot(0);
  EXPECT_EQ(snapshot.relayed_messages, 2u);
  EXPECT_EQ(snapshot.dropped_messages, 0u);
}

}  // namespace
