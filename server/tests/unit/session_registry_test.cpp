#include <atomic>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "quickfs/id_generator.hpp"
#include "quickfs/session_registry.hpp"
#include "unit/fake_channel.hpp"

namespace {

using quickfs::testing::FakeChannel;

quickfs::FileMetadata SampleMeta() { return {"report.pdf", "application/pdf", 2048}; }

bool IsLowerHex(const std::string& value) {
  for (char c : value) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      return false;
    }
  }
  return true;
}

TEST(SessionRegistryTest, CreatedIdsAreUniqueAmongLiveSessions) {
  quickfs::SessionRegistry registry;
  std::set<std::string> ids;
  for (int i = 0; i < 500; ++i) {
    auto session = registry.Create(SampleMeta(), std::make_shared<FakeChannel>());
    EXPECT_EQ(session->Id().size(), 2 * quickfs::kSessionIdBytes);
    EXPECT_TRUE(IsLowerHex(session->Id()));
    EXPECT_TRUE(ids.insert(session->Id()).second);
  }
  EXPECT_EQ(registry.ActiveCount(), 500u);
}

TEST(SessionRegistryTest, LookupAndRemove) {
  quickfs::SessionRegistry registry;
  auto host = std::make_shared<FakeChannel>();
  auto session = registry.Create(SampleMeta(), host);

  auto found = registry.Lookup(session->Id());
  ASSERT_NE(found, nullptr);
  EXPECT_EQ(found, session);
  EXPECT_EQ(found->HostChannel(), host);
  EXPECT_EQ(found->Metadata().filename, "report.pdf");

  EXPECT_TRUE(registry.Remove(session->Id()));
  EXPECT_EQ(registry.Lookup(session->Id()), nullptr);
  EXPECT_FALSE(registry.Remove(session->Id()));
  EXPECT_EQ(registry.ActiveCount(), 0u);
}

TEST(SessionRegistryTest, UnknownIdIsNotFound) {
  quickfs::SessionRegistry registry;
  EXPECT_EQ(registry.Lookup("deadbeef"), nullptr);
  EXPECT_EQ(registry.Lookup(""), nullptr);
}

TEST(SessionRegistryTest, RetriesOnIdCollision) {
  quickfs::SessionRegistry registry;
  std::vector<std::string> sequence{"aaaa0000", "aaaa0000", "aaaa0000", "bbbb1111"};
  std::size_t next = 0;
  registry.SetIdGenerator([&]() { return sequence.at(next++); });

  auto first = registry.Create(SampleMeta(), std::make_shared<FakeChannel>());
  auto second = registry.Create(SampleMeta(), std::make_shared<FakeChannel>());
  EXPECT_EQ(first->Id(), "aaaa0000");
  EXPECT_EQ(second->Id(), "bbbb1111");
  EXPECT_EQ(next, sequence.size());
}

TEST(SessionRegistryTest, RemovedIdCanBeReused) {
  quickfs::SessionRegistry registry;
  registry.SetIdGenerator([]() { return std::string("cafe0001"); });
  auto first = registry.Create(SampleMeta(), std::make_shared<FakeChannel>());
  registry.Remove(first->Id());
  auto second = registry.Create(SampleMeta(), std::make_shared<FakeChannel>());
  EXPECT_EQ(second->Id(), "cafe0001");
  EXPECT_NE(first, second);
}

TEST(SessionRegistryTest, ThrowsWhenEveryAttemptCollides) {
  quickfs::SessionRegistry registry;
  registry.SetIdGenerator([]() { return std::string("11112222"); });
  registry.Create(SampleMeta(), std::make_shared<FakeChannel>());
  EXPECT_THROW(registry.Create(SampleMeta(), std::make_shared<FakeChannel>()), std::runtime_error);
  EXPECT_EQ(registry.ActiveCount(), 1u);
}

TEST(SessionRegistryTest, ConcurrentCreateLookupRemove) {
  auto registry = std::make_shared<quickfs::SessionRegistry>();
  constexpr int kThreads = 8;
  constexpr int kRounds = 100;
  std::atomic<int> lookup_misses{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < kRounds; ++i) {
        auto session = registry->Create(SampleMeta(), std::make_shared<FakeChannel>());
        auto found = registry->Lookup(session->Id());
        if (!found || found->Metadata().filesize != 2048) {
          lookup_misses.fetch_add(1);
        }
        registry->Remove(session->Id());
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }
  EXPECT_EQ(lookup_misses.load(), 0);
  EXPECT_EQ(registry->ActiveCount(), 0u);
}

TEST(IdGeneratorTest, ReceiverIdsAreLongerThanSessionIds) {
  auto receiver_id = quickfs::GenerateReceiverId();
  auto session_id = quickfs::GenerateSessionId();
  EXPECT_EQ(receiver_id.size(), 16u);
  EXPECT_EQ(session_id.size(), 8u);
  EXPECT_TRUE(IsLowerHex(receiver_id));
  EXPECT_NE(quickfs::GenerateReceiverId(), receiver_id);
}

}  // namespace
