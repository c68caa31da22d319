#include "network/bootstrap.hpp"
#include <boost/log/trivial.hpp>

namespace peerchunks {
namespace network {

Bootstrap::Bootstrap(const config::NodeConfig& config)
    : config_(config) {

    local_peer_.address = config_.advertise_address.empty()
        ? "127.0.0.1:" + std::to_string(config_.peer_port)
        : config_.advertise_address;

    BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Initializing node " << local_peer_.address;

    try {
        // Storage and index have no dependencies
        store_ = std::make_unique<store::ChunkStore>(config_.storage_path);
        index_ = std::make_unique<index::MutexLocationIndex>();
        BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: Chunk store and location index created successfully";

        // Client role and replication policy on top of the store
        chunk_client_ = std::make_unique<ChunkClient>(*store_, config_.request_timeout, config_.fetch_timeout);
        replicator_ = std::make_unique<replication::Replicator>(*store_, *chunk_client_, local_peer_);
        BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: Replicator created successfully";

        context_ = std::make_unique<SessionContext>(SessionContext{
            config_.encryption_key, *store_, *index_, *replicator_, local_peer_});

        // Create TCP server without peer manager initially
        tcp_server_ = std::make_unique<TCP_Server>(config_.peer_port, config_.listen_address);
        BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: TCP Server created successfully";

        std::vector<PeerRecord> bootstrap_peers;
        for (const auto& address : config_.bootstrap_peers) {
            bootstrap_peers.push_back(PeerRecord{address});
        }
        peer_manager_ = std::make_unique<PeerManager>(*context_, bootstrap_peers);
        BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: Peer Manager created successfully";

        // Set peer manager in TCP server
        tcp_server_->set_peer_manager(*peer_manager_);

        // Create file server last as it depends on all other components
        file_server_ = std::make_unique<file_server::FileServer>(
            *store_, *index_, *replicator_, *chunk_client_, *peer_manager_, local_peer_, config_.chunk_size);
        BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: File Server created successfully";

        BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Successfully created all components";
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Failed to initialize components: " << e.what();
        throw;
    }
}

bool Bootstrap::connect_to_bootstrap_nodes() {
    BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Connecting to bootstrap nodes...";

    bool all_connected = true;

    for (const auto& node : config_.bootstrap_peers) {
        if (node == local_peer_.address) {
            BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: Skipping own address " << node;
            continue;
        }

        if (!tcp_server_->connect(node)) {
            BOOST_LOG_TRIVIAL(warning) << "Bootstrap program: Could not connect to bootstrap node " << node;
            all_connected = false;
        }
    }

    return all_connected;
}

bool Bootstrap::connect(const std::string& address) {
    if (!split_address(address)) {
        BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Invalid address format: " << address;
        return false;
    }

    peer_manager_->add_known_peer(PeerRecord{address});
    return tcp_server_->connect(address);
}

bool Bootstrap::start() {
    try {
        // Start TCP server
        if (!tcp_server_->start_listener()) {
            BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Failed to start TCP server";
            return false;
        }

        // Dial failures are not fatal, the peers may come up later
        if (!config_.bootstrap_peers.empty()) {
            if (!connect_to_bootstrap_nodes()) {
                BOOST_LOG_TRIVIAL(warning) << "Bootstrap program: Failed to connect to some bootstrap nodes";
            }
        }

        BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Bootstrap successfully started";

        return true;
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Failed to start bootstrap: " << e.what();
        return false;
    }
}

bool Bootstrap::shutdown() {
    try {
        BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Initiating shutdown sequence";

        // First shutdown file server as it depends on other components
        file_server_.reset();

        // Stop accepting before sessions go away
        if (tcp_server_) {
            BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: Stopping TCP Server";
            tcp_server_->shutdown();
        }

        // Sessions hold sockets of the server's io_context, stop them before it is destroyed
        if (peer_manager_) {
            BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: Shutting down Peer Manager";
            peer_manager_->shutdown();
            peer_manager_.reset();
        }

        tcp_server_.reset();
        context_.reset();
        replicator_.reset();
        chunk_client_.reset();
        index_.reset();
        store_.reset();

        BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Shutdown complete";
        return true;
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Error during shutdown: " << e.what();
        return false;
    }
}

Bootstrap::~Bootstrap() {
    try {
        if (!this->shutdown()) {
            BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Failed to shutdown cleanly in destructor";
        }
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Error during destructor shutdown: " << e.what();
    }
}

} // namespace network
} // namespace peerchunks
