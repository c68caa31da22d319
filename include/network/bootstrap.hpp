#pragma once

#include <string>
#include <vector>
#include <memory>
#include "config/config.hpp"
#include "network/tcp_server.hpp"
#include "network/peer_manager.hpp"
#include "network/chunk_client.hpp"
#include "index/mutex_location_index.hpp"
#include "replication/replicator.hpp"
#include "store/chunk_store.hpp"
#include "file_server/file_server.hpp"

namespace peerchunks {
namespace network {

class Bootstrap {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Bootstrap(const config::NodeConfig& config);
  ~Bootstrap();

  // ---- INITIALIZATION AND DESTRUCTION METHODS ----
  // Starts listener and connects to bootstrap nodes
  bool start();
  // Terminates all components in dependency order
  bool shutdown();
  bool connect_to_bootstrap_nodes();
  // Remembers the address as a known peer and dials it
  bool connect(const std::string& address);


  // ---- GETTERS AND SETTERS ----
  PeerManager& get_peer_manager() { return *peer_manager_; }
  file_server::FileServer& get_file_server() { return *file_server_; }
  index::LocationIndex& get_index() { return *index_; }
  store::ChunkStore& get_store() { return *store_; }
  const PeerRecord& local_peer() const { return local_peer_; }

private:
  // ---- PARAMETERS ----
  config::NodeConfig config_;
  PeerRecord local_peer_;

  // System components
  std::unique_ptr<store::ChunkStore> store_;
  std::unique_ptr<index::MutexLocationIndex> index_;
  std::unique_ptr<ChunkClient> chunk_client_;
  std::unique_ptr<replication::Replicator> replicator_;
  std::unique_ptr<SessionContext> context_;
  std::unique_ptr<TCP_Server> tcp_server_;
  std::unique_ptr<PeerManager> peer_manager_;
  std::unique_ptr<file_server::FileServer> file_server_;
};

} // namespace network
} // namespace peerchunks
