#ifndef BXFER_TRANSFER_FILE_CHUNKER_HPP
#define BXFER_TRANSFER_FILE_CHUNKER_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>
#include "crypto/checksum.hpp"
#include "transfer/transfer_types.hpp"

namespace bxfer {
namespace transfer {

struct ChunkDescriptor {
  uint32_t index;
  uint64_t offset;
  std::size_t size;
};

// Splits a file into fixed-size chunks, the last one may be shorter.
// An empty file yields a single empty chunk.
class FileChunker {
public:
  // Throws std::invalid_argument for a zero chunk size, std::runtime_error if the file cannot be opened
  FileChunker(const std::filesystem::path& path, std::size_t chunk_size);

  static std::vector<ChunkDescriptor> plan(uint64_t file_size, std::size_t chunk_size);

  // Reads a chunk and computes its checksum
  Chunk read_chunk(uint32_t index, const crypto::ChecksumService& checksum);

  const std::vector<ChunkDescriptor>& chunks() const { return chunks_; }
  uint32_t chunk_count() const { return static_cast<uint32_t>(chunks_.size()); }
  uint64_t file_size() const { return file_size_; }
  std::size_t chunk_size() const { return chunk_size_; }

private:
  std::filesystem::path path_;
  std::size_t chunk_size_;
  uint64_t file_size_;
  std::vector<ChunkDescriptor> chunks_;
  std::ifstream file_;
};

} // namespace transfer
} // namespace bxfer

#endif // BXFER_TRANSFER_FILE_CHUNKER_HPP
