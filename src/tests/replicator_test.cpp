#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <memory>
#include "replication/replicator.hpp"
#include "test_utils.hpp"

using namespace peerchunks::replication;
using peerchunks::network::PeerRecord;
using peerchunks::store::ChunkMetadata;
using peerchunks::store::ChunkStore;
using peerchunks::store::FileId;
using peerchunks::store::generate_file_id;
using ::testing::_;
using ::testing::Eq;
using ::testing::Field;
using ::testing::Throw;

class MockChunkSender : public ChunkSender {
public:
  MOCK_METHOD(void, push_chunk, (const PeerRecord& peer, const std::filesystem::path& directory,
                                 const FileId& file_id, std::size_t chunk_index), (override));
};

class ReplicatorTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<ChunkStore> store;
  ::testing::StrictMock<MockChunkSender> sender;
  std::unique_ptr<Replicator> replicator;
  const PeerRecord self{"127.0.0.1:4000"};
  FileId file_id = generate_file_id();

  static void SetUpTestSuite() {
    init_logging();
  }

  void SetUp() override {
    test_dir = make_temp_dir("replicator_test");
    store = std::make_unique<ChunkStore>(test_dir);
    replicator = std::make_unique<Replicator>(*store, sender, self);
  }

  void TearDown() override {
    replicator.reset();
    store.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  void store_chunks(std::size_t count) {
    std::filesystem::path directory = store->initialize_storage(file_id);
    for (std::size_t i = 0; i < count; ++i) {
      std::string data = "chunk-" + std::to_string(i);
      store->save_chunk(directory, ChunkMetadata{file_id, i, data.size(), count}, data);
    }
  }

  static auto peer_is(const std::string& address) {
    return Field(&PeerRecord::address, Eq(address));
  }
};

TEST_F(ReplicatorTest, PushesEveryChunkToTwoPeers) {
  store_chunks(3);
  std::vector<PeerRecord> candidates = {{"127.0.0.1:4001"}, {"127.0.0.1:4002"}, {"127.0.0.1:4003"}};

  for (std::size_t i = 0; i < 3; ++i) {
    EXPECT_CALL(sender, push_chunk(peer_is("127.0.0.1:4001"), store->file_directory(file_id), file_id, i));
    EXPECT_CALL(sender, push_chunk(peer_is("127.0.0.1:4002"), store->file_directory(file_id), file_id, i));
  }

  ReplicationReport report = replicator->replicate(file_id, candidates);
  EXPECT_EQ(report.pushed, 6u);
  EXPECT_EQ(report.skipped, 0u);
  EXPECT_EQ(report.failed, 0u);
}

TEST_F(ReplicatorTest, InsufficientPeersPushesNothing) {
  store_chunks(2);

  try {
    replicator->replicate(file_id, {{"127.0.0.1:4001"}});
    FAIL() << "Expected InsufficientPeersError";
  } catch (const InsufficientPeersError& e) {
    EXPECT_EQ(e.required(), REPLICATION_FACTOR);
    EXPECT_EQ(e.available(), 1u);
    EXPECT_EQ(e.chunk_index(), 0u);
  }

  EXPECT_THROW(replicator->replicate(file_id, {}), InsufficientPeersError);
}

TEST_F(ReplicatorTest, SelfAndDuplicatesAreNotCounted) {
  store_chunks(1);
  std::vector<PeerRecord> candidates = {self, {"127.0.0.1:4001"}, {"127.0.0.1:4001"}, self};

  EXPECT_THROW(replicator->replicate(file_id, candidates), InsufficientPeersError);

  std::vector<PeerRecord> eligible = replicator->eligible_peers(candidates);
  ASSERT_EQ(eligible.size(), 1u);
  EXPECT_EQ(eligible[0].address, "127.0.0.1:4001");
}

TEST_F(ReplicatorTest, SelfIsSkippedWhenChoosingTargets) {
  store_chunks(1);
  std::vector<PeerRecord> candidates = {self, {"127.0.0.1:4001"}, {"127.0.0.1:4002"}};

  EXPECT_CALL(sender, push_chunk(peer_is("127.0.0.1:4001"), _, file_id, 0u));
  EXPECT_CALL(sender, push_chunk(peer_is("127.0.0.1:4002"), _, file_id, 0u));

  EXPECT_EQ(replicator->replicate(file_id, candidates).pushed, 2u);
}

TEST_F(ReplicatorTest, RepeatedReplicationIsSkipped) {
  store_chunks(2);
  std::vector<PeerRecord> candidates = {{"127.0.0.1:4001"}, {"127.0.0.1:4002"}};

  EXPECT_CALL(sender, push_chunk(_, _, file_id, _)).Times(4);

  EXPECT_EQ(replicator->replicate(file_id, candidates).pushed, 4u);

  ReplicationReport second = replicator->replicate(file_id, candidates);
  EXPECT_EQ(second.pushed, 0u);
  EXPECT_EQ(second.skipped, 4u);
}

TEST_F(ReplicatorTest, FailedPushDoesNotStopOthersAndIsRetried) {
  store_chunks(2);
  std::vector<PeerRecord> candidates = {{"127.0.0.1:4001"}, {"127.0.0.1:4002"}};

  {
    ::testing::InSequence sequence;
    EXPECT_CALL(sender, push_chunk(peer_is("127.0.0.1:4001"), _, file_id, 0u))
      .WillOnce(Throw(std::runtime_error("connection refused")));
    EXPECT_CALL(sender, push_chunk(peer_is("127.0.0.1:4002"), _, file_id, 0u));
    EXPECT_CALL(sender, push_chunk(peer_is("127.0.0.1:4001"), _, file_id, 1u));
    EXPECT_CALL(sender, push_chunk(peer_is("127.0.0.1:4002"), _, file_id, 1u));
    // Only the failed push is attempted again
    EXPECT_CALL(sender, push_chunk(peer_is("127.0.0.1:4001"), _, file_id, 0u));
  }

  ReplicationReport first = replicator->replicate(file_id, candidates);
  EXPECT_EQ(first.pushed, 3u);
  EXPECT_EQ(first.failed, 1u);

  ReplicationReport second = replicator->replicate(file_id, candidates);
  EXPECT_EQ(second.pushed, 1u);
  EXPECT_EQ(second.skipped, 3u);
  EXPECT_EQ(second.failed, 0u);
}

TEST_F(ReplicatorTest, FileWithoutChunksPushesNothing) {
  store_chunks(0);
  std::vector<PeerRecord> candidates = {{"127.0.0.1:4001"}, {"127.0.0.1:4002"}};

  ReplicationReport report = replicator->replicate(file_id, candidates);
  EXPECT_EQ(report.pushed, 0u);
}

TEST_F(ReplicatorTest, UnknownFileThrowsNotFound) {
  std::vector<PeerRecord> candidates = {{"127.0.0.1:4001"}, {"127.0.0.1:4002"}};
  EXPECT_THROW(replicator->replicate(generate_file_id(), candidates), peerchunks::store::NotFoundError);
}
