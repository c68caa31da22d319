#include "network/codec.hpp"
#include <algorithm>
#include <cstring>
#include <boost/log/trivial.hpp>

namespace peerchunks {
namespace network {

namespace {

const std::size_t FILE_ID_LENGTH = 36;

bool starts_with(const std::string& text, const char* prefix) {
  std::size_t length = std::strlen(prefix);
  return text.size() >= length && text.compare(0, length, prefix) == 0;
}

// Visitor producing the wire bytes of each frame alternative
struct FrameEncoder {
  std::string operator()(const DhtRequest&) const {
    return std::string(Codec::DHT_REQUEST) + "\n";
  }

  std::string operator()(const DhtResponse& response) const {
    std::string output = std::string(Codec::DHT_RESPONSE_PREFIX) +
                         std::to_string(response.entries.size()) + "\n";
    for (const auto& entry : response.entries) {
      output += store::to_string(entry.file_id) + ":" + entry.address + "\n";
    }
    return output;
  }

  std::string operator()(const ChunkRequest& request) const {
    return std::string(Codec::CHUNK_REQUEST_PREFIX) + store::to_string(request.file_id) + ":" +
           std::to_string(request.chunk_index) + "\n";
  }

  std::string operator()(const ChunkResponse& response) const {
    return std::string(Codec::CHUNK_RESPONSE_PREFIX) + store::to_string(response.file_id) + ":" +
           std::to_string(response.chunk_index) + ":" + std::to_string(response.data.size()) + ":" +
           response.data;
  }

  std::string operator()(const ChunkPush& push) const {
    return store::to_string(push.file_id) + ":" + std::to_string(push.chunk_index) + ":" +
           std::to_string(push.data.size()) + ":" + push.data;
  }

  std::string operator()(const EncryptedText& text) const {
    return text.nonce_hex + ":" + text.ciphertext_hex + "\n";
  }

  std::string operator()(const Malformed& malformed) const {
    return malformed.text + "\n";
  }
};

} // namespace

//==============================================
// DECODING
//==============================================

std::optional<MessageFrame> Codec::decode(std::string& buffer) {
  if (buffer.empty()) {
    return std::nullopt;
  }

  // Binary frames are recognized before any line scanning, their payload may hold newlines
  BinaryHeader header;
  if (starts_with(buffer, CHUNK_RESPONSE_PREFIX)) {
    HeaderStatus status = parse_binary_header(buffer, std::strlen(CHUNK_RESPONSE_PREFIX), header);
    if (status == HeaderStatus::INCOMPLETE) {
      return std::nullopt;
    }
    if (status != HeaderStatus::LINE) {
      return decode_binary(buffer, header, false, status);
    }
  } else if (buffer.size() > FILE_ID_LENGTH && buffer[FILE_ID_LENGTH] == ':' &&
             store::parse_file_id(buffer.substr(0, FILE_ID_LENGTH))) {
    HeaderStatus status = parse_binary_header(buffer, 0, header);
    if (status == HeaderStatus::INCOMPLETE) {
      return std::nullopt;
    }
    if (status != HeaderStatus::LINE) {
      return decode_binary(buffer, header, true, status);
    }
  }

  return decode_line(buffer);
}

Codec::HeaderStatus Codec::parse_binary_header(const std::string& buffer, std::size_t offset,
                                               BinaryHeader& header) {
  std::size_t colons[3];
  int found = 0;
  std::size_t limit = std::min(buffer.size(), offset + MAX_HEADER_LENGTH);

  for (std::size_t i = offset; i < limit && found < 3; ++i) {
    if (buffer[i] == '\n') {
      return HeaderStatus::LINE;
    }
    if (buffer[i] == ':') {
      colons[found++] = i;
    }
  }

  if (found < 3) {
    if (limit == offset + MAX_HEADER_LENGTH) {
      header.length = limit;
      return HeaderStatus::INVALID;
    }
    return HeaderStatus::INCOMPLETE;
  }

  header.length = colons[2] + 1;

  auto file_id = store::parse_file_id(buffer.substr(offset, colons[0] - offset));
  if (!file_id ||
      !parse_decimal(buffer.substr(colons[0] + 1, colons[1] - colons[0] - 1), header.chunk_index) ||
      !parse_decimal(buffer.substr(colons[1] + 1, colons[2] - colons[1] - 1), header.size)) {
    return HeaderStatus::INVALID;
  }

  header.file_id = *file_id;
  return HeaderStatus::COMPLETE;
}

std::optional<MessageFrame> Codec::decode_binary(std::string& buffer, const BinaryHeader& header,
                                                 bool is_push, HeaderStatus status) {
  if (status == HeaderStatus::INVALID || header.size > MAX_FRAME_SIZE) {
    std::string text = buffer.substr(0, header.length);
    buffer.erase(0, header.length);
    BOOST_LOG_TRIVIAL(warning) << "Codec: Rejected binary frame header: " << text;
    return MessageFrame{Malformed{text}};
  }

  if (buffer.size() < header.length + header.size) {
    return std::nullopt;
  }

  std::string data = buffer.substr(header.length, header.size);
  buffer.erase(0, header.length + header.size);

  if (is_push) {
    return MessageFrame{ChunkPush{header.file_id, header.chunk_index, std::move(data)}};
  }
  return MessageFrame{ChunkResponse{header.file_id, header.chunk_index, std::move(data)}};
}

std::optional<MessageFrame> Codec::decode_line(std::string& buffer) {
  std::size_t line_end = buffer.find('\n');
  if (line_end == std::string::npos) {
    if (buffer.size() > MAX_LINE_LENGTH) {
      BOOST_LOG_TRIVIAL(warning) << "Codec: Discarding " << buffer.size() << " bytes without a newline";
      std::string text = buffer.substr(0, 64);
      buffer.clear();
      return MessageFrame{Malformed{text}};
    }
    return std::nullopt;
  }

  std::string line = trim_carriage_return(buffer.substr(0, line_end));

  if (starts_with(line, DHT_RESPONSE_PREFIX)) {
    return decode_dht_response(buffer, line.substr(std::strlen(DHT_RESPONSE_PREFIX)), line_end);
  }

  buffer.erase(0, line_end + 1);
  return classify_line(line);
}

std::optional<MessageFrame> Codec::decode_dht_response(std::string& buffer, const std::string& count_text,
                                                       std::size_t first_line_end) {
  std::size_t count = 0;
  if (!parse_decimal(count_text, count)) {
    buffer.erase(0, first_line_end + 1);
    return MessageFrame{Malformed{std::string(DHT_RESPONSE_PREFIX) + count_text}};
  }

  // The block is only decoded once every entry line arrived
  std::vector<std::string> lines;
  std::size_t cursor = first_line_end + 1;
  for (std::size_t i = 0; i < count; ++i) {
    std::size_t next = buffer.find('\n', cursor);
    if (next == std::string::npos) {
      return std::nullopt;
    }
    lines.push_back(trim_carriage_return(buffer.substr(cursor, next - cursor)));
    cursor = next + 1;
  }
  buffer.erase(0, cursor);

  DhtResponse response;
  for (const auto& line : lines) {
    try {
      response.entries.push_back(parse_index_entry(line));
    } catch (const ProtocolParseError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Codec: Skipping DHT entry: " << e.what();
    }
  }

  return MessageFrame{std::move(response)};
}

MessageFrame Codec::classify_line(const std::string& line) {
  if (line == DHT_REQUEST) {
    return DhtRequest{};
  }

  if (starts_with(line, CHUNK_REQUEST_PREFIX)) {
    try {
      return parse_chunk_request(line.substr(std::strlen(CHUNK_REQUEST_PREFIX)));
    } catch (const ProtocolParseError& e) {
      BOOST_LOG_TRIVIAL(debug) << "Codec: " << e.what();
      return Malformed{line};
    }
  }

  // A response header cut short by a newline
  if (starts_with(line, CHUNK_RESPONSE_PREFIX)) {
    return Malformed{line};
  }

  std::size_t colon_pos = line.find(':');
  if (colon_pos != std::string::npos && colon_pos > 0 && colon_pos + 1 < line.size() &&
      line.find(':', colon_pos + 1) == std::string::npos) {
    return EncryptedText{line.substr(0, colon_pos), line.substr(colon_pos + 1)};
  }

  return Malformed{line};
}


ChunkRequest Codec::parse_chunk_request(const std::string& fields) {
  std::size_t colon_pos = fields.find(':');
  if (colon_pos == std::string::npos) {
    throw ProtocolParseError("chunk request without index: " + fields);
  }

  auto file_id = store::parse_file_id(fields.substr(0, colon_pos));
  if (!file_id) {
    throw ProtocolParseError("invalid file identifier in chunk request: " + fields);
  }

  std::size_t chunk_index = 0;
  if (!parse_decimal(fields.substr(colon_pos + 1), chunk_index)) {
    throw ProtocolParseError("invalid chunk index in chunk request: " + fields);
  }

  return ChunkRequest{*file_id, chunk_index};
}

index::IndexEntry Codec::parse_index_entry(const std::string& line) {
  // The address itself contains a colon, the identifier ends at the first one
  std::size_t colon_pos = line.find(':');
  if (colon_pos == std::string::npos || colon_pos + 1 >= line.size()) {
    throw ProtocolParseError("index entry without address: " + line);
  }

  auto file_id = store::parse_file_id(line.substr(0, colon_pos));
  if (!file_id) {
    throw ProtocolParseError("invalid file identifier in index entry: " + line);
  }

  return index::IndexEntry{*file_id, line.substr(colon_pos + 1)};
}


//==============================================
// ENCODING
//==============================================

std::string Codec::encode(const MessageFrame& frame) {
  return std::visit(FrameEncoder{}, frame);
}


//==============================================
// UTILITY METHODS
//==============================================

bool Codec::parse_decimal(const std::string& text, std::size_t& value) {
  if (text.empty() || text.size() > 19 ||
      !std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
    return false;
  }
  value = static_cast<std::size_t>(std::stoull(text));
  return true;
}

std::string Codec::trim_carriage_return(const std::string& line) {
  if (!line.empty() && line.back() == '\r') {
    return line.substr(0, line.size() - 1);
  }
  return line;
}

} // namespace network
} // namespace peerchunks
