#ifndef PEERCHUNKS_NETWORK_PEER_SESSION_HPP
#define PEERCHUNKS_NETWORK_PEER_SESSION_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "network/connection_state.hpp"
#include "network/message_frame.hpp"
#include "network/types.hpp"
#include "index/location_index.hpp"
#include "replication/replicator.hpp"
#include "store/chunk_store.hpp"

namespace peerchunks {
namespace network {

// Node-wide collaborators shared by every session
struct SessionContext {
    std::string encryption_key;
    store::ChunkStore& store;
    index::LocationIndex& index;
    replication::Replicator& replicator;
    PeerRecord local_peer;
};

class PeerSession {
public:
    // Delete copy operations to prevent socket duplication
    PeerSession(const PeerSession&) = delete;
    PeerSession& operator=(const PeerSession&) = delete;


    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    // peers is the snapshot used for replication triggered by this session
    PeerSession(boost::asio::ip::tcp::socket socket, SessionContext& context, std::vector<PeerRecord> peers);
    ~PeerSession();


    // ---- SESSION CONTROL ----
    // Spawns the session thread: handshake, then serve until the stream ends
    bool start();
    // Shuts the socket down and joins the session thread
    void stop();


    // ---- GETTERS AND SETTERS ----
    ConnectionState::State get_state() const;
    bool is_closed() const;
    const std::string& remote_address() const { return remote_address_; }

private:
    // ---- PARAMETERS ----
    boost::asio::ip::tcp::socket socket_;
    SessionContext& context_;
    const std::vector<PeerRecord> peers_;
    std::string remote_address_;

    // Bytes received but not yet decoded
    std::string buffer_;

    ConnectionState state_;
    mutable std::mutex state_mutex_;
    std::mutex write_mutex_;

    std::unique_ptr<std::thread> session_thread_;
    std::atomic<bool> sent_index_{false};
    std::atomic<bool> stopping_{false};


    // ---- SESSION LOOP ----
    void run();
    bool perform_handshake();
    void serve();
    void transition_to(ConnectionState::State new_state);


    // ---- FRAME HANDLERS ----
    // Dispatches a decoded frame to the overload for its alternative
    void handle_frame(const MessageFrame& frame);
    void handle(const DhtRequest& request);
    void handle(const DhtResponse& response);
    void handle(const ChunkRequest& request);
    void handle(const ChunkResponse& response);
    void handle(const ChunkPush& push);
    void handle(const EncryptedText& text);
    void handle(const Malformed& malformed);


    // ---- OUTGOING DATA ----
    bool send(const std::string& data);
    // Sends this node's full index as one DHT_RESPONSE block
    bool send_index();
    // Writes a received chunk into the local store, false on failure
    bool store_chunk(const store::FileId& file_id, std::size_t chunk_index, const std::string& data);
};

} // namespace network
} // namespace peerchunks

#endif // PEERCHUNKS_NETWORK_PEER_SESSION_HPP
