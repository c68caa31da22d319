#ifndef PEERCHUNKS_NETWORK_CODEC_HPP
#define PEERCHUNKS_NETWORK_CODEC_HPP

#include <cstddef>
#include <optional>
#include <string>
#include "network/message_frame.hpp"
#include "network/network_error.hpp"

namespace peerchunks {
namespace network {

class Codec {
public:
  // ---- WIRE CONSTANTS ----
  static constexpr const char* DHT_REQUEST = "DHT_REQUEST";
  static constexpr const char* DHT_RESPONSE_PREFIX = "DHT_RESPONSE:";
  static constexpr const char* CHUNK_REQUEST_PREFIX = "CHUNK_REQUEST:";
  static constexpr const char* CHUNK_RESPONSE_PREFIX = "CHUNK_RESPONSE:";
  static constexpr const char* ACK = "OK";

  // Longest line kept while waiting for its newline
  static constexpr std::size_t MAX_LINE_LENGTH = 1024 * 1024;


  // ---- DECODING ----
  // Removes one complete frame from the front of buffer.
  // Returns nullopt and leaves buffer untouched when more bytes are needed.
  static std::optional<MessageFrame> decode(std::string& buffer);


  // ---- ENCODING ----
  // Serializes a frame into its exact wire bytes
  static std::string encode(const MessageFrame& frame);

private:
  // Longest "<file-id>:<index>:<size>:" header
  static constexpr std::size_t MAX_HEADER_LENGTH = 96;

  enum class HeaderStatus {
    INCOMPLETE,  // more bytes needed
    COMPLETE,
    LINE,        // a newline came first, the bytes form a text line
    INVALID      // header.length bytes of garbage to discard
  };

  struct BinaryHeader {
    store::FileId file_id;
    std::size_t chunk_index = 0;
    std::size_t size = 0;
    std::size_t length = 0;
  };

  // ---- DECODING HELPERS ----
  // Parses "<file-id>:<index>:<size>:" starting at offset
  static HeaderStatus parse_binary_header(const std::string& buffer, std::size_t offset,
                                          BinaryHeader& header);
  static std::optional<MessageFrame> decode_binary(std::string& buffer, const BinaryHeader& header,
                                                   bool is_push, HeaderStatus status);
  static std::optional<MessageFrame> decode_line(std::string& buffer);
  static std::optional<MessageFrame> decode_dht_response(std::string& buffer, const std::string& count_text,
                                                         std::size_t first_line_end);
  static MessageFrame classify_line(const std::string& line);
  // Field parsers, throw ProtocolParseError on text that breaks the grammar
  static ChunkRequest parse_chunk_request(const std::string& fields);
  static index::IndexEntry parse_index_entry(const std::string& line);


  // ---- UTILITY METHODS ----
  static bool parse_decimal(const std::string& text, std::size_t& value);
  static std::string trim_carriage_return(const std::string& line);
};

} // namespace network
} // namespace peerchunks

#endif // PEERCHUNKS_NETWORK_CODEC_HPP
