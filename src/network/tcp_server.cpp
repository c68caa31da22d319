#include "network/tcp_server.hpp"
#include "network/types.hpp"

namespace peerchunks {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TCP_Server::TCP_Server(const uint16_t port, const std::string& address)
  : port_(port)
  , address_(address)
  , is_running_(false)
  , peer_manager_(nullptr) {
  BOOST_LOG_TRIVIAL(debug) << "TCP server: Peer port " << address << ":" << port;
}

TCP_Server::~TCP_Server() {
  shutdown();
}


//==============================================
// LISTENER
//==============================================

bool TCP_Server::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "TCP server: Already listening on " << address_ << ":" << port_;
    return false;
  }

  // Sessions cannot be created without a manager to own them
  if (!peer_manager_) {
    BOOST_LOG_TRIVIAL(error) << "TCP server: Cannot listen without a peer manager";
    return false;
  }

  try {
    boost::asio::ip::tcp::endpoint endpoint(boost::asio::ip::make_address(address_), port_);

    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();

    is_running_ = true;
    start_accept();

    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        auto work_guard = boost::asio::make_work_guard(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "TCP server: Acceptor loop stopped: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "TCP server: Listening for peers on " << address_ << ":" << port_;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP server: Cannot listen on " << address_ << ":" << port_ << ": " << e.what();
    acceptor_.reset();
    return false;
  }
}

void TCP_Server::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  auto socket = std::make_shared<boost::asio::ip::tcp::socket>(io_context_);

  acceptor_->async_accept(*socket,
    [this, socket](const boost::system::error_code& error) {
      if (!error) {
        boost::system::error_code ec;
        auto remote = socket->remote_endpoint(ec);
        BOOST_LOG_TRIVIAL(debug) << "TCP server: Inbound peer "
                                 << (ec ? std::string("unknown") : remote.address().to_string() + ":" +
                                                                   std::to_string(remote.port()));
        peer_manager_->create_session(std::move(*socket));
      } else if (error != boost::asio::error::operation_aborted) {
        BOOST_LOG_TRIVIAL(error) << "TCP server: Accept failed: " << error.message();
      }
      start_accept();
    });
}

void TCP_Server::shutdown() {
  if (!is_running_ && !io_thread_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "TCP server: Closing peer port " << port_;

  is_running_ = false;

  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "TCP server: Error closing acceptor: " << ec.message();
    }
  }

  io_context_.stop();

  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();

  BOOST_LOG_TRIVIAL(debug) << "TCP server: Peer port " << port_ << " closed";
}


//==============================================
// OUTBOUND SESSIONS
//==============================================

bool TCP_Server::dial(const std::string& host, uint16_t port, boost::asio::ip::tcp::socket& socket) {
  try {
    boost::asio::ip::tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(host, std::to_string(port));

    BOOST_LOG_TRIVIAL(debug) << "TCP server: Dialing peer " << host << ":" << port;
    boost::asio::connect(socket, endpoints);

    BOOST_LOG_TRIVIAL(info) << "TCP server: Opened session with peer " << host << ":" << port;
    return true;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP server: Peer " << host << ":" << port << " unreachable: " << e.what();
    return false;
  }
}

bool TCP_Server::connect(const std::string& remote_address) {
  if (!peer_manager_) {
    BOOST_LOG_TRIVIAL(error) << "TCP server: Cannot dial without a peer manager";
    return false;
  }

  auto endpoint = split_address(remote_address);
  if (!endpoint) {
    BOOST_LOG_TRIVIAL(error) << "TCP server: Peer address must be host:port, got " << remote_address;
    return false;
  }

  boost::asio::ip::tcp::socket socket(io_context_);
  if (!dial(endpoint->first, endpoint->second, socket)) {
    return false;
  }

  return peer_manager_->create_session(std::move(socket)) != nullptr;
}


//==============================================
// GETTERS AND SETTERS
//==============================================

void TCP_Server::set_peer_manager(PeerManager& peer_manager) {
  peer_manager_ = &peer_manager;
}

} // namespace network
} // namespace peerchunks
