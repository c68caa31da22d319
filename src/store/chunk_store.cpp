#include "store/chunk_store.hpp"
#include <algorithm>
#include <fstream>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace peerchunks {
namespace store {

namespace {
const std::string CHUNK_PREFIX = "chunk_";
const std::string CHUNK_SUFFIX = ".bin";
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with root directory path and ensure it exists
ChunkStore::ChunkStore(const std::filesystem::path& root) : root_(root) {
  BOOST_LOG_TRIVIAL(info) << "Chunk store: Initializing store with root: " << root_.string();

  if (std::filesystem::exists(root_) && !std::filesystem::is_directory(root_)) {
    BOOST_LOG_TRIVIAL(error) << "Chunk store: Root exists but is not a directory: " << root_.string();
    throw InvalidPathError("Chunk store: Root is not a directory: " + root_.string());
  }

  check_directory_exists(root_);
  BOOST_LOG_TRIVIAL(debug) << "Chunk store: Root directory created/verified at: " << root_.string();
}


//==============================================
// CHUNKING
//==============================================

SplitResult ChunkStore::split(const std::filesystem::path& file_path, std::size_t chunk_size) {
  SplitResult result;
  result.file_id = split(file_path, chunk_size,
    [&result](const ChunkMetadata& metadata, const std::string& data) {
      result.chunks.push_back(Chunk{metadata, data});
    });
  return result;
}

FileId ChunkStore::split(const std::filesystem::path& file_path, std::size_t chunk_size,
                         const ChunkSink& sink) {
  if (chunk_size == 0) {
    throw std::invalid_argument("Chunk store: Chunk size must be greater than zero");
  }

  BOOST_LOG_TRIVIAL(info) << "Chunk store: Splitting " << file_path.string()
                          << " into chunks of " << chunk_size << " bytes";

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Chunk store: Failed to open file: " << file_path.string();
    throw StoreError("Chunk store: Failed to open file: " + file_path.string());
  }

  std::error_code ec;
  std::uintmax_t file_size = std::filesystem::file_size(file_path, ec);
  std::size_t total_hint = ec ? 0 : static_cast<std::size_t>((file_size + chunk_size - 1) / chunk_size);

  FileId file_id = generate_file_id();
  std::string buffer(chunk_size, '\0');
  std::size_t chunk_index = 0;

  while (true) {
    file.read(&buffer[0], static_cast<std::streamsize>(chunk_size));
    if (file.bad()) {
      throw StoreError("Chunk store: Failed to read file: " + file_path.string());
    }

    auto bytes_read = static_cast<std::size_t>(file.gcount());
    if (bytes_read == 0) {
      break;
    }

    ChunkMetadata metadata{file_id, chunk_index, bytes_read, total_hint};
    sink(metadata, buffer.substr(0, bytes_read));
    ++chunk_index;

    if (file.eof()) {
      break;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Chunk store: Split " << file_path.string() << " into "
                          << chunk_index << " chunks with file id " << to_string(file_id);
  return file_id;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::filesystem::path ChunkStore::initialize_storage(const FileId& file_id) const {
  std::filesystem::path directory = file_directory(file_id);
  try {
    check_directory_exists(directory);
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Chunk store: Failed to create directory: " << e.what();
    throw StoreError("Chunk store: Failed to create directory: " + std::string(e.what()));
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunk store: Storage initialized at " << directory.string();
  return directory;
}

void ChunkStore::save_chunk(const std::filesystem::path& directory, const ChunkMetadata& metadata,
                            const std::string& data) const {
  if (metadata.chunk_size != data.size()) {
    BOOST_LOG_TRIVIAL(error) << "Chunk store: Chunk " << metadata.chunk_index << " declares "
                             << metadata.chunk_size << " bytes but carries " << data.size();
    throw StoreError("Chunk store: Chunk length does not match metadata");
  }

  std::filesystem::path chunk_path = directory / chunk_filename(metadata.chunk_index);

  // Open output file in binary mode, overwriting any previous copy
  std::ofstream file(chunk_path, std::ios::binary | std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Chunk store: Failed to create file: " << chunk_path.string();
    throw StoreError("Chunk store: Failed to create file: " + chunk_path.string());
  }

  file.write(data.data(), static_cast<std::streamsize>(data.size()));
  file.close();
  if (!file) {
    throw StoreError("Chunk store: Failed to write file: " + chunk_path.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunk store: Saved chunk " << metadata.chunk_index << " of file "
                           << to_string(metadata.file_id) << " (" << data.size() << " bytes)";
}

std::string ChunkStore::get_chunk(const std::filesystem::path& directory, std::size_t index) const {
  std::filesystem::path chunk_path = directory / chunk_filename(index);

  if (!std::filesystem::is_regular_file(chunk_path)) {
    BOOST_LOG_TRIVIAL(debug) << "Chunk store: Chunk not found: " << chunk_path.string();
    throw NotFoundError("Chunk store: Chunk not found: " + chunk_path.string());
  }

  std::ifstream file(chunk_path, std::ios::binary);
  if (!file) {
    throw StoreError("Chunk store: Failed to open file: " + chunk_path.string());
  }

  std::string data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw StoreError("Chunk store: Failed to read file: " + chunk_path.string());
  }

  return data;
}

std::vector<std::size_t> ChunkStore::list_chunks(const std::filesystem::path& directory) const {
  if (!std::filesystem::is_directory(directory)) {
    throw NotFoundError("Chunk store: Directory not found: " + directory.string());
  }

  std::vector<std::size_t> indices;
  try {
    for (const auto& entry : std::filesystem::directory_iterator(directory)) {
      std::size_t index = 0;
      if (entry.is_regular_file() && parse_chunk_filename(entry.path().filename().string(), index)) {
        indices.push_back(index);
      }
    }
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Chunk store: Failed to scan directory: " << e.what();
    throw StoreError("Chunk store: Failed to scan directory: " + std::string(e.what()));
  }

  // Filesystem order is arbitrary, "chunk_01.bin" and "chunk_1.bin" collide
  std::sort(indices.begin(), indices.end());
  indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
  return indices;
}

void ChunkStore::clear() {
  BOOST_LOG_TRIVIAL(info) << "Chunk store: Clearing entire store at: " << root_.string();
  std::filesystem::remove_all(root_);
  check_directory_exists(root_);
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::filesystem::path ChunkStore::file_directory(const FileId& file_id) const {
  return root_ / to_string(file_id);
}

std::string ChunkStore::chunk_filename(std::size_t index) {
  return CHUNK_PREFIX + std::to_string(index) + CHUNK_SUFFIX;
}

bool ChunkStore::parse_chunk_filename(const std::string& filename, std::size_t& index) {
  if (filename.size() <= CHUNK_PREFIX.size() + CHUNK_SUFFIX.size() ||
      filename.compare(0, CHUNK_PREFIX.size(), CHUNK_PREFIX) != 0 ||
      filename.compare(filename.size() - CHUNK_SUFFIX.size(), CHUNK_SUFFIX.size(), CHUNK_SUFFIX) != 0) {
    return false;
  }

  std::string digits = filename.substr(CHUNK_PREFIX.size(),
                                       filename.size() - CHUNK_PREFIX.size() - CHUNK_SUFFIX.size());
  if (!std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
    return false;
  }

  try {
    index = static_cast<std::size_t>(std::stoull(digits));
  } catch (const std::out_of_range&) {
    return false;
  }
  return true;
}


//==============================================
// UTILITY METHODS
//==============================================

void ChunkStore::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

} // namespace store
} // namespace peerchunks
