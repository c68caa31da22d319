#ifndef PEERCHUNKS_NETWORK_TCP_CLIENT_HPP
#define PEERCHUNKS_NETWORK_TCP_CLIENT_HPP

#include <chrono>
#include <string>
#include <boost/asio.hpp>
#include "network/network_error.hpp"

namespace peerchunks {
namespace network {

/**
 * Short-lived outbound connection with blocking calls and optional deadlines.
 * Each operation runs the private io_context until it completes or the
 * timeout expires. A zero timeout waits indefinitely.
 * All failures are thrown as NetworkError.
 */
class TCP_Client {
public:
  // Delete copy operations to prevent socket duplication
  TCP_Client(const TCP_Client&) = delete;
  TCP_Client& operator=(const TCP_Client&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit TCP_Client(std::chrono::milliseconds timeout);
  ~TCP_Client();


  // ---- CONNECTION ----
  // Resolves "host:port" and connects
  void connect(const std::string& address);
  void close();


  // ---- DATA TRANSFER ----
  // Writes all bytes
  void write(const std::string& data);
  // Appends at least one received byte to buffer, false once the peer closed the stream
  bool read_some(std::string& buffer);


  // ---- GETTERS AND SETTERS ----
  void set_timeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }
  const std::string& remote_address() const { return remote_address_; }

private:
  // ---- PARAMETERS ----
  boost::asio::io_context io_context_;
  boost::asio::ip::tcp::socket socket_;
  std::chrono::milliseconds timeout_;
  std::string remote_address_;


  // Runs pending operations, throws TIMEOUT and closes the socket if they outlast timeout_
  void run(const char* operation);
};

} // namespace network
} // namespace peerchunks

#endif // PEERCHUNKS_NETWORK_TCP_CLIENT_HPP
