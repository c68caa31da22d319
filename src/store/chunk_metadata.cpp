#include "store/chunk_metadata.hpp"
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace peerchunks {
namespace store {

FileId generate_file_id() {
  // random_generator seeds itself from the OS entropy source
  boost::uuids::random_generator generator;
  return generator();
}

std::string to_string(const FileId& file_id) {
  return boost::uuids::to_string(file_id);
}

std::optional<FileId> parse_file_id(const std::string& text) {
  // Only the 36 character hyphenated form is accepted
  if (text.size() != 36 || text[8] != '-' || text[13] != '-' || text[18] != '-' || text[23] != '-') {
    return std::nullopt;
  }

  try {
    boost::uuids::string_generator parser;
    return parser(text);
  } catch (const std::runtime_error&) {
    return std::nullopt;
  }
}

} // namespace store
} // namespace peerchunks
