#include "network/peer_session.hpp"
#include "network/codec.hpp"
#include "crypto/message_cipher.hpp"
#include <array>
#include <boost/log/trivial.hpp>

namespace peerchunks {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

PeerSession::PeerSession(boost::asio::ip::tcp::socket socket, SessionContext& context, std::vector<PeerRecord> peers)
  : socket_(std::move(socket))
  , context_(context)
  , peers_(std::move(peers)) {
  boost::system::error_code ec;
  auto endpoint = socket_.remote_endpoint(ec);
  if (ec) {
    remote_address_ = "unknown";
  } else {
    remote_address_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
  }
  BOOST_LOG_TRIVIAL(debug) << "Peer session: Created session for " << remote_address_
                           << " with " << peers_.size() << " known peers";
}

// Stop the session thread and release the socket on destruction
PeerSession::~PeerSession() {
  stop();
  BOOST_LOG_TRIVIAL(debug) << "Peer session: Session destroyed: " << remote_address_;
}


//==============================================
// SESSION CONTROL
//==============================================

bool PeerSession::start() {
  if (session_thread_) {
    BOOST_LOG_TRIVIAL(debug) << "Peer session: Session already started for " << remote_address_;
    return true;
  }

  if (!socket_.is_open()) {
    BOOST_LOG_TRIVIAL(error) << "Peer session: Cannot start session, socket not connected";
    return false;
  }

  session_thread_ = std::make_unique<std::thread>(&PeerSession::run, this);
  BOOST_LOG_TRIVIAL(info) << "Peer session: Session started with " << remote_address_;
  return true;
}

void PeerSession::stop() {
  stopping_ = true;

  // Shutdown unblocks the read the session thread is waiting in
  if (socket_.is_open()) {
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected) {
      BOOST_LOG_TRIVIAL(debug) << "Peer session: Socket shutdown error: " << ec.message();
    }
  }

  if (session_thread_ && session_thread_->joinable()) {
    session_thread_->join();
    session_thread_.reset();
    BOOST_LOG_TRIVIAL(debug) << "Peer session: Session thread joined for " << remote_address_;
  }

  if (socket_.is_open()) {
    boost::system::error_code ec;
    socket_.close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Peer session: Socket close error: " << ec.message();
    }
  }

  transition_to(ConnectionState::State::CLOSED);
}


//==============================================
// SESSION LOOP
//==============================================

void PeerSession::run() {
  if (!perform_handshake()) {
    transition_to(ConnectionState::State::CLOSED);
    return;
  }

  transition_to(ConnectionState::State::SERVING);
  serve();
  transition_to(ConnectionState::State::CLOSED);

  BOOST_LOG_TRIVIAL(info) << "Peer session: Session with " << remote_address_ << " closed";
}

bool PeerSession::perform_handshake() {
  BOOST_LOG_TRIVIAL(debug) << "Peer session: Sending handshake to " << remote_address_;

  try {
    crypto::EncryptedMessage welcome = crypto::MessageCipher::encrypt(
      "Welcome to PeerChunks, peer " + remote_address_, context_.encryption_key);

    if (!send(Codec::encode(EncryptedText{welcome.nonce_hex, welcome.ciphertext_hex})) ||
        !send(Codec::encode(DhtRequest{}))) {
      return false;
    }
  } catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(error) << "Peer session: Failed to encrypt welcome message: " << e.what();
    return false;
  }

  BOOST_LOG_TRIVIAL(debug) << "Peer session: Handshake sent to " << remote_address_;
  return true;
}

void PeerSession::serve() {
  std::array<char, 8192> chunk;

  while (!stopping_) {
    boost::system::error_code ec;
    std::size_t bytes_read = socket_.read_some(boost::asio::buffer(chunk), ec);

    if (ec == boost::asio::error::eof) {
      BOOST_LOG_TRIVIAL(info) << "Peer session: " << remote_address_ << " closed the connection";
      return;
    }
    if (ec) {
      if (!stopping_) {
        BOOST_LOG_TRIVIAL(warning) << "Peer session: Read error from " << remote_address_ << ": " << ec.message();
      }
      return;
    }

    buffer_.append(chunk.data(), bytes_read);
    BOOST_LOG_TRIVIAL(trace) << "Peer session: Received " << bytes_read << " bytes from " << remote_address_;

    // Frames are handled strictly in arrival order
    while (auto frame = Codec::decode(buffer_)) {
      handle_frame(*frame);
    }
  }
}

void PeerSession::transition_to(ConnectionState::State new_state) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (state_.get_state() == new_state) {
    return;
  }
  ConnectionState::State old_state = state_.get_state();
  if (state_.transition_to(new_state)) {
    BOOST_LOG_TRIVIAL(debug) << "Peer session: " << remote_address_ << " " << old_state << " -> " << new_state;
  } else {
    BOOST_LOG_TRIVIAL(warning) << "Peer session: Invalid transition " << old_state << " -> " << new_state;
  }
}


//==============================================
// FRAME HANDLERS
//==============================================

void PeerSession::handle_frame(const MessageFrame& frame) {
  std::visit([this](const auto& message) { handle(message); }, frame);
}

void PeerSession::handle(const DhtRequest& /*request*/) {
  BOOST_LOG_TRIVIAL(info) << "Peer session: DHT_REQUEST from " << remote_address_;
  send_index();
}

void PeerSession::handle(const DhtResponse& response) {
  BOOST_LOG_TRIVIAL(info) << "Peer session: DHT_RESPONSE with " << response.entries.size()
                          << " entries from " << remote_address_;
  context_.index.merge_all(response.entries);

  // One round only, a response to our response would ping-pong forever
  if (!sent_index_) {
    send_index();
  }
}

void PeerSession::handle(const ChunkRequest& request) {
  std::string file_text = store::to_string(request.file_id);
  BOOST_LOG_TRIVIAL(info) << "Peer session: CHUNK_REQUEST for chunk " << request.chunk_index
                          << " of file " << file_text << " from " << remote_address_;

  std::string data;
  try {
    data = context_.store.get_chunk(context_.store.file_directory(request.file_id), request.chunk_index);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "Peer session: Cannot serve chunk " << request.chunk_index
                               << " of file " << file_text << ": " << e.what();
    return;
  }

  if (send(Codec::encode(ChunkResponse{request.file_id, request.chunk_index, std::move(data)}))) {
    BOOST_LOG_TRIVIAL(debug) << "Peer session: Sent chunk " << request.chunk_index << " of file "
                             << file_text << " to " << remote_address_;
  }
}

void PeerSession::handle(const ChunkResponse& response) {
  BOOST_LOG_TRIVIAL(info) << "Peer session: CHUNK_RESPONSE for chunk " << response.chunk_index
                          << " of file " << store::to_string(response.file_id) << " from " << remote_address_;
  store_chunk(response.file_id, response.chunk_index, response.data);
}

void PeerSession::handle(const ChunkPush& push) {
  std::string file_text = store::to_string(push.file_id);
  BOOST_LOG_TRIVIAL(info) << "Peer session: Received chunk " << push.chunk_index << " of file "
                          << file_text << " (" << push.data.size() << " bytes) from " << remote_address_;

  if (!store_chunk(push.file_id, push.chunk_index, push.data)) {
    return;
  }

  if (!send(Codec::ACK)) {
    return;
  }

  context_.index.register_location(push.file_id, context_.local_peer);

  try {
    context_.replicator.replicate(push.file_id, peers_);
  } catch (const replication::InsufficientPeersError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Peer session: Replication of file " << file_text << " skipped: " << e.what();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Peer session: Replication of file " << file_text << " failed: " << e.what();
  }
}

void PeerSession::handle(const EncryptedText& text) {
  try {
    std::string plaintext = crypto::MessageCipher::decrypt(text.nonce_hex, text.ciphertext_hex,
                                                           context_.encryption_key);
    BOOST_LOG_TRIVIAL(info) << "Peer session: Message from " << remote_address_ << ": " << plaintext;
  } catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Peer session: Failed to decrypt message from " << remote_address_
                               << ": " << e.what();
  }
}

void PeerSession::handle(const Malformed& malformed) {
  BOOST_LOG_TRIVIAL(warning) << "Peer session: Discarding malformed input from " << remote_address_
                             << ": " << malformed.text.substr(0, 128);
}


//==============================================
// OUTGOING DATA
//==============================================

bool PeerSession::send(const std::string& data) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  boost::system::error_code ec;
  boost::asio::write(socket_, boost::asio::buffer(data), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Peer session: Write to " << remote_address_ << " failed: " << ec.message();
    return false;
  }
  return true;
}

bool PeerSession::send_index() {
  DhtResponse response;
  response.entries = context_.index.export_all();

  if (!send(Codec::encode(response))) {
    return false;
  }

  sent_index_ = true;
  BOOST_LOG_TRIVIAL(info) << "Peer session: Sent DHT_RESPONSE with " << response.entries.size()
                          << " entries to " << remote_address_;
  return true;
}

bool PeerSession::store_chunk(const store::FileId& file_id, std::size_t chunk_index, const std::string& data) {
  try {
    std::filesystem::path directory = context_.store.initialize_storage(file_id);
    store::ChunkMetadata metadata{file_id, chunk_index, data.size(), 0};
    context_.store.save_chunk(directory, metadata, data);
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Peer session: Failed to store chunk " << chunk_index << " of file "
                             << store::to_string(file_id) << ": " << e.what();
    return false;
  }
}


//==============================================
// GETTERS AND SETTERS
//==============================================

ConnectionState::State PeerSession::get_state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_.get_state();
}

bool PeerSession::is_closed() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_.is_terminal();
}

} // namespace network
} // namespace peerchunks
