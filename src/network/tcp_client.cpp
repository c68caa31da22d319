#include "network/tcp_client.hpp"
#include "network/types.hpp"
#include <array>
#include <boost/log/trivial.hpp>

namespace peerchunks {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TCP_Client::TCP_Client(std::chrono::milliseconds timeout)
  : socket_(io_context_)
  , timeout_(timeout) {
}

TCP_Client::~TCP_Client() {
  close();
}


//==============================================
// CONNECTION
//==============================================

void TCP_Client::connect(const std::string& address) {
  auto endpoint = split_address(address);
  if (!endpoint) {
    BOOST_LOG_TRIVIAL(error) << "TCP client: Invalid address: " << address;
    throw NetworkError(NetworkErrc::CONNECTION_FAILED, "invalid address " + address);
  }

  remote_address_ = address;
  BOOST_LOG_TRIVIAL(debug) << "TCP client: Resolving " << address;

  boost::system::error_code ec;
  boost::asio::ip::tcp::resolver resolver(io_context_);
  auto endpoints = resolver.resolve(endpoint->first, std::to_string(endpoint->second), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "TCP client: Failed to resolve " << address << ": " << ec.message();
    throw NetworkError(NetworkErrc::CONNECTION_FAILED, address + ": " + ec.message());
  }

  boost::system::error_code result = boost::asio::error::would_block;
  boost::asio::async_connect(socket_, endpoints,
    [&result](const boost::system::error_code& error, const boost::asio::ip::tcp::endpoint&) {
      result = error;
    });
  run("connect");

  if (result) {
    BOOST_LOG_TRIVIAL(error) << "TCP client: Connection to " << address << " failed: " << result.message();
    throw NetworkError(NetworkErrc::CONNECTION_FAILED, address + ": " + result.message());
  }

  BOOST_LOG_TRIVIAL(debug) << "TCP client: Connected to " << address;
}

void TCP_Client::close() {
  if (socket_.is_open()) {
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "TCP client: Socket close error: " << ec.message();
    }
  }
}


//==============================================
// DATA TRANSFER
//==============================================

void TCP_Client::write(const std::string& data) {
  boost::system::error_code result = boost::asio::error::would_block;
  boost::asio::async_write(socket_, boost::asio::buffer(data),
    [&result](const boost::system::error_code& error, std::size_t /*bytes_transferred*/) {
      result = error;
    });
  run("write");

  if (result) {
    BOOST_LOG_TRIVIAL(error) << "TCP client: Write to " << remote_address_ << " failed: " << result.message();
    throw NetworkError(NetworkErrc::TRANSFER_FAILED, remote_address_ + ": " + result.message());
  }

  BOOST_LOG_TRIVIAL(trace) << "TCP client: Sent " << data.size() << " bytes to " << remote_address_;
}

bool TCP_Client::read_some(std::string& buffer) {
  std::array<char, 8192> chunk;
  std::size_t received = 0;
  boost::system::error_code result = boost::asio::error::would_block;

  socket_.async_read_some(boost::asio::buffer(chunk),
    [&result, &received](const boost::system::error_code& error, std::size_t bytes_transferred) {
      result = error;
      received = bytes_transferred;
    });
  run("read");

  if (result == boost::asio::error::eof) {
    BOOST_LOG_TRIVIAL(debug) << "TCP client: " << remote_address_ << " closed the connection";
    return false;
  }
  if (result) {
    BOOST_LOG_TRIVIAL(error) << "TCP client: Read from " << remote_address_ << " failed: " << result.message();
    throw NetworkError(NetworkErrc::CONNECTION_LOST, remote_address_ + ": " + result.message());
  }

  buffer.append(chunk.data(), received);
  return true;
}


//==============================================
// EVENT LOOP
//==============================================

void TCP_Client::run(const char* operation) {
  io_context_.restart();

  if (timeout_.count() == 0) {
    io_context_.run();
    return;
  }

  io_context_.run_for(timeout_);

  if (!io_context_.stopped()) {
    // Closing the socket aborts the pending operation, let its handler finish
    boost::system::error_code ec;
    socket_.close(ec);
    io_context_.run();

    BOOST_LOG_TRIVIAL(warning) << "TCP client: " << operation << " with " << remote_address_
                               << " timed out after " << timeout_.count() << " ms";
    throw NetworkError(NetworkErrc::TIMEOUT, std::string(operation) + " with " + remote_address_);
  }
}

} // namespace network
} // namespace peerchunks
