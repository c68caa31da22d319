#pragma once

#include <string>
#include <filesystem>
#include <functional>
#include <vector>
#include <stdexcept>
#include "store/chunk_metadata.hpp"

namespace peerchunks {
namespace store {

// One chunk as produced by the splitter
struct Chunk {
  ChunkMetadata metadata;
  std::string data;
};

struct SplitResult {
  FileId file_id;
  std::vector<Chunk> chunks;
};

// Receives chunks in index order while a file is being split
using ChunkSink = std::function<void(const ChunkMetadata&, const std::string&)>;

class ChunkStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ChunkStore(const std::filesystem::path& root);


  // ---- CHUNKING ----
  // Splits a file into chunk_size pieces under a fresh identifier
  static SplitResult split(const std::filesystem::path& file_path, std::size_t chunk_size);
  // Streaming form, hands every chunk to the sink as soon as it is read
  static FileId split(const std::filesystem::path& file_path, std::size_t chunk_size,
                      const ChunkSink& sink);


  // ---- CORE STORAGE OPERATIONS ----
  // Creates root/<file-id> if needed and returns it
  std::filesystem::path initialize_storage(const FileId& file_id) const;
  // Writes or overwrites chunk_<index>.bin in the given directory
  void save_chunk(const std::filesystem::path& directory, const ChunkMetadata& metadata,
                  const std::string& data) const;
  // Reads a whole chunk, throws NotFoundError if it is absent
  std::string get_chunk(const std::filesystem::path& directory, std::size_t index) const;
  // Ascending unique indices of the chunk files present in the directory
  std::vector<std::size_t> list_chunks(const std::filesystem::path& directory) const;
  // Removes all stored data and resets the root
  void clear();


  // ---- QUERY OPERATIONS ----
  std::filesystem::path file_directory(const FileId& file_id) const;
  const std::filesystem::path& root() const { return root_; }

  static std::string chunk_filename(std::size_t index);
  // Parses chunk_<N>.bin, returns false for any other name
  static bool parse_chunk_filename(const std::string& filename, std::size_t& index);

private:
  // ---- PARAMETERS ----
  std::filesystem::path root_;

  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

class NotFoundError : public StoreError {
public:
  explicit NotFoundError(const std::string& message) : StoreError(message) {}
};

class InvalidPathError : public StoreError {
public:
  explicit InvalidPathError(const std::string& message) : StoreError(message) {}
};

} // namespace store
} // namespace peerchunks
