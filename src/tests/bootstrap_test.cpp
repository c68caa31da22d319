#include <gtest/gtest.h>
#include <thread>
#include <chrono>
#include <memory>
#include "network/bootstrap.hpp"
#include "network/peer_manager.hpp"
#include "file_server/file_server.hpp"
#include "test_utils.hpp"

using namespace peerchunks::network;
using peerchunks::file_server::IncompleteFileError;
using peerchunks::file_server::InvalidFileIdError;
using peerchunks::file_server::UploadResult;
using peerchunks::store::to_string;

class BootstrapTest : public ::testing::Test {
protected:
  const std::string ADDRESS = "127.0.0.1";
  const std::size_t CHUNK_SIZE = 16;

  std::filesystem::path test_dir;
  std::vector<std::unique_ptr<Bootstrap>> peers;

  static void SetUpTestSuite() {
    init_logging();
  }

  void SetUp() override {
    test_dir = make_temp_dir("bootstrap_test");
  }

  void TearDown() override {
    // Shut nodes down before their storage goes away
    for (auto& peer : peers) {
      peer->shutdown();
    }
    peers.clear();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  peerchunks::config::NodeConfig make_config(uint16_t port, std::vector<std::string> bootstrap_nodes = {}) {
    peerchunks::config::NodeConfig config;
    config.peer_port = port;
    config.bootstrap_peers = std::move(bootstrap_nodes);
    config.storage_path = test_dir / ("node_" + std::to_string(port));
    config.encryption_key = TEST_KEY;
    config.listen_address = ADDRESS;
    config.advertise_address = ADDRESS + ":" + std::to_string(port);
    config.chunk_size = CHUNK_SIZE;
    config.request_timeout = std::chrono::milliseconds(2000);
    config.fetch_timeout = std::chrono::milliseconds(300);
    return config;
  }

  Bootstrap& start_peer(uint16_t port, std::vector<std::string> bootstrap_nodes = {}) {
    peers.push_back(std::make_unique<Bootstrap>(make_config(port, std::move(bootstrap_nodes))));
    EXPECT_TRUE(peers.back()->start()) << "Failed to start peer on port " << port;
    return *peers.back();
  }

  std::filesystem::path create_test_file(const std::string& name, const std::string& content) {
    std::filesystem::path path = test_dir / name;
    write_file(path, content);
    return path;
  }

  static std::string address_of(uint16_t port) {
    return "127.0.0.1:" + std::to_string(port);
  }

  static bool index_knows(Bootstrap& peer, const peerchunks::store::FileId& file_id, const std::string& address) {
    auto holders = peer.get_index().lookup(file_id);
    if (!holders) {
      return false;
    }
    for (const auto& holder : *holders) {
      if (holder.address == address) {
        return true;
      }
    }
    return false;
  }
};

TEST_F(BootstrapTest, StartAndShutdown) {
  Bootstrap& peer = start_peer(47201);
  EXPECT_EQ(peer.local_peer().address, address_of(47201));
  EXPECT_TRUE(peer.shutdown());
  // A second shutdown is harmless
  EXPECT_TRUE(peer.shutdown());
}

TEST_F(BootstrapTest, UploadThenDownloadWithoutPeers) {
  Bootstrap& peer = start_peer(47202);
  const std::string content = "A file that spans several sixteen byte chunks of data.";

  UploadResult result = peer.get_file_server().upload(create_test_file("input.txt", content));

  EXPECT_EQ(result.chunk_count, (content.size() + CHUNK_SIZE - 1) / CHUNK_SIZE);
  EXPECT_FALSE(result.replicated);
  EXPECT_NE(result.replication_error.find("Insufficient peers"), std::string::npos);
  EXPECT_EQ(peer.get_file_server().search(to_string(result.file_id)),
            (std::vector<std::string>{address_of(47202)}));

  std::filesystem::path output = test_dir / "output.txt";
  peer.get_file_server().download(to_string(result.file_id), output);
  EXPECT_EQ(read_file(output), content);
}

TEST_F(BootstrapTest, SmallChunksReassembleExactly) {
  auto config = make_config(47207);
  config.chunk_size = 5;
  peers.push_back(std::make_unique<Bootstrap>(config));
  Bootstrap& peer = *peers.back();
  ASSERT_TRUE(peer.start());

  const std::string content = "0123456789abcdefghijklmnopqrstuvwx";
  ASSERT_EQ(content.size(), 34u);

  UploadResult result = peer.get_file_server().upload(create_test_file("small.txt", content));
  EXPECT_EQ(result.chunk_count, 7u);

  auto& store = peer.get_store();
  auto directory = store.file_directory(result.file_id);
  EXPECT_EQ(store.list_chunks(directory), (std::vector<std::size_t>{0, 1, 2, 3, 4, 5, 6}));
  EXPECT_EQ(store.get_chunk(directory, 6), "uvwx");

  std::filesystem::path output = test_dir / "small_out.txt";
  peer.get_file_server().download(to_string(result.file_id), output);
  EXPECT_EQ(read_file(output), content);
}

TEST_F(BootstrapTest, EmptyFileRoundTripFails) {
  Bootstrap& peer = start_peer(47203);

  UploadResult result = peer.get_file_server().upload(create_test_file("empty.txt", ""));
  EXPECT_EQ(result.chunk_count, 0u);

  // No chunk exists locally and the only holder is this node
  EXPECT_THROW(peer.get_file_server().download(to_string(result.file_id), test_dir / "out.txt"),
               IncompleteFileError);
}

TEST_F(BootstrapTest, DownloadRejectsInvalidIdentifier) {
  Bootstrap& peer = start_peer(47204);
  EXPECT_THROW(peer.get_file_server().download("not-a-file-id", test_dir / "out.txt"), InvalidFileIdError);
}

TEST_F(BootstrapTest, DownloadOfUnknownFileFails) {
  Bootstrap& peer = start_peer(47205);
  auto unknown = peerchunks::store::generate_file_id();
  EXPECT_THROW(peer.get_file_server().download(to_string(unknown), test_dir / "out.txt"),
               peerchunks::index::NotFoundInIndexError);
}

TEST_F(BootstrapTest, UploadMissingFileThrows) {
  Bootstrap& peer = start_peer(47206);
  EXPECT_THROW(peer.get_file_server().upload(test_dir / "missing.txt"), peerchunks::store::StoreError);
}

TEST_F(BootstrapTest, IndexesConvergeOnConnect) {
  Bootstrap& first = start_peer(47211);
  Bootstrap& second = start_peer(47212);
  UploadResult first_upload = first.get_file_server().upload(create_test_file("first.txt", "first content"));
  UploadResult second_upload = second.get_file_server().upload(create_test_file("second.txt", "second content"));

  ASSERT_TRUE(second.connect(address_of(47211)));

  // Each side learns the other's file
  EXPECT_TRUE(wait_until([&]() { return index_knows(second, first_upload.file_id, address_of(47211)); }));
  EXPECT_TRUE(wait_until([&]() { return index_knows(first, second_upload.file_id, address_of(47212)); }));
  EXPECT_EQ(second.get_file_server().search(to_string(first_upload.file_id)),
            (std::vector<std::string>{address_of(47211)}));
  EXPECT_EQ(first.get_file_server().search(to_string(second_upload.file_id)),
            (std::vector<std::string>{address_of(47212)}));

  // Both sides end up exporting the same pairs
  EXPECT_EQ(first.get_index().export_all().size(), 2u);
  EXPECT_EQ(second.get_index().export_all().size(), 2u);
  EXPECT_EQ(first.get_index().size(), second.get_index().size());
}

TEST_F(BootstrapTest, DownloadFetchesChunksFromHolder) {
  Bootstrap& first = start_peer(47221);
  const std::string content = "Remote content fetched chunk by chunk over loopback.";
  UploadResult result = first.get_file_server().upload(create_test_file("remote.txt", content));

  Bootstrap& second = start_peer(47222, {address_of(47221)});
  ASSERT_TRUE(wait_until([&]() { return index_knows(second, result.file_id, address_of(47221)); }));

  std::filesystem::path output = test_dir / "fetched.txt";
  second.get_file_server().download(to_string(result.file_id), output);
  EXPECT_EQ(read_file(output), content);

  // The fetched chunks stay in the second node's store
  auto indices = second.get_store().list_chunks(second.get_store().file_directory(result.file_id));
  EXPECT_EQ(indices.size(), result.chunk_count);
}

TEST_F(BootstrapTest, UploadReplicatesToTwoPeers) {
  Bootstrap& second = start_peer(47232);
  Bootstrap& third = start_peer(47233);
  Bootstrap& first = start_peer(47231, {address_of(47232), address_of(47233)});

  const std::string content = "Replicated content for two peers.";
  UploadResult result = first.get_file_server().upload(create_test_file("replicated.txt", content));

  EXPECT_TRUE(result.replicated) << result.replication_error;

  for (Bootstrap* replica : {&second, &third}) {
    auto directory = replica->get_store().file_directory(result.file_id);
    EXPECT_EQ(replica->get_store().list_chunks(directory).size(), result.chunk_count);
    EXPECT_TRUE(wait_until([&]() { return index_knows(*replica, result.file_id, replica->local_peer().address); }));

    // Every replica can rebuild the file on its own
    std::filesystem::path output = test_dir / ("replica_" + replica->local_peer().address.substr(10) + ".txt");
    replica->get_file_server().download(to_string(result.file_id), output);
    EXPECT_EQ(read_file(output), content);
  }
}

TEST_F(BootstrapTest, ReceivedPushIsReplicatedOnward) {
  // Only the middle node knows the last one, so the last node can only get chunks through it
  Bootstrap& last = start_peer(47253);
  Bootstrap& side = start_peer(47254);
  Bootstrap& middle = start_peer(47252, {address_of(47253), address_of(47254)});
  Bootstrap& origin = start_peer(47251, {address_of(47252), address_of(47254)});

  const std::string content = "Chunks that travel two hops before they land.";
  UploadResult result = origin.get_file_server().upload(create_test_file("chain.txt", content));
  ASSERT_TRUE(result.replicated) << result.replication_error;
  ASSERT_EQ(result.chunk_count, 3u);

  auto last_directory = last.get_store().file_directory(result.file_id);
  EXPECT_TRUE(wait_until([&]() {
    return std::filesystem::exists(last_directory) &&
           last.get_store().list_chunks(last_directory).size() == result.chunk_count;
  }));
  EXPECT_TRUE(wait_until([&]() { return index_knows(last, result.file_id, address_of(47253)); }));

  for (Bootstrap* replica : {&middle, &side}) {
    auto directory = replica->get_store().file_directory(result.file_id);
    EXPECT_EQ(replica->get_store().list_chunks(directory).size(), result.chunk_count);
  }

  std::filesystem::path output = test_dir / "chain_out.txt";
  last.get_file_server().download(to_string(result.file_id), output);
  EXPECT_EQ(read_file(output), content);
}

TEST_F(BootstrapTest, FullMeshSettlesAfterUpload) {
  Bootstrap& first = start_peer(47261);
  Bootstrap& second = start_peer(47262, {address_of(47261)});
  Bootstrap& third = start_peer(47263, {address_of(47261), address_of(47262)});

  // Every node knows the other two, over one connection per pair
  first.get_peer_manager().add_known_peer(PeerRecord{address_of(47262)});
  first.get_peer_manager().add_known_peer(PeerRecord{address_of(47263)});
  second.get_peer_manager().add_known_peer(PeerRecord{address_of(47263)});

  std::vector<Bootstrap*> mesh{&first, &second, &third};
  auto all_quiet = [&]() {
    for (Bootstrap* node : mesh) {
      if (node->get_peer_manager().session_addresses().size() != 2) {
        return false;
      }
    }
    return true;
  };
  ASSERT_TRUE(wait_until(all_quiet));

  const std::string content = "Every node pushes each chunk to each neighbour once.";
  UploadResult result = first.get_file_server().upload(create_test_file("mesh.txt", content));
  ASSERT_TRUE(result.replicated) << result.replication_error;

  for (Bootstrap* node : mesh) {
    auto directory = node->get_store().file_directory(result.file_id);
    EXPECT_TRUE(wait_until([&]() {
      return std::filesystem::exists(directory) &&
             node->get_store().list_chunks(directory).size() == result.chunk_count;
    })) << node->local_peer().address;
  }

  // Push connections close once the pushes stop, only the mesh links remain
  EXPECT_TRUE(wait_until(all_quiet));
  std::this_thread::sleep_for(std::chrono::milliseconds(500));
  EXPECT_TRUE(all_quiet());
}

TEST_F(BootstrapTest, ConnectAddsKnownPeer) {
  start_peer(47241);
  Bootstrap& second = start_peer(47242);

  EXPECT_TRUE(second.connect(address_of(47241)));
  auto known = second.get_peer_manager().known_peers();
  ASSERT_EQ(known.size(), 1u);
  EXPECT_EQ(known[0].address, address_of(47241));

  EXPECT_FALSE(second.connect("missing-port"));
  EXPECT_FALSE(second.connect(address_of(47249)));
}
