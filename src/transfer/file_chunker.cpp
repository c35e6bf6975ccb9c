#include "transfer/file_chunker.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <stdexcept>

namespace bxfer {
namespace transfer {

FileChunker::FileChunker(const std::filesystem::path& path, std::size_t chunk_size)
  : path_(path)
  , chunk_size_(chunk_size)
  , file_size_(0) {
  if (chunk_size_ == 0) {
    throw std::invalid_argument("Chunk size must be positive");
  }

  file_.open(path_, std::ios::binary);
  if (!file_) {
    throw std::runtime_error("Failed to open source file: " + path_.string());
  }
  file_size_ = std::filesystem::file_size(path_);
  chunks_ = plan(file_size_, chunk_size_);

  BOOST_LOG_TRIVIAL(debug) << "Chunker: " << path_.filename().string() << " (" << file_size_ << " bytes) split into "
                           << chunks_.size() << " chunk(s) of up to " << chunk_size_ << " bytes";
}

std::vector<ChunkDescriptor> FileChunker::plan(uint64_t file_size, std::size_t chunk_size) {
  std::vector<ChunkDescriptor> chunks;
  if (file_size == 0) {
    chunks.push_back(ChunkDescriptor{0, 0, 0});
    return chunks;
  }

  uint64_t offset = 0;
  uint32_t index = 0;
  while (offset < file_size) {
    const auto size = static_cast<std::size_t>(std::min<uint64_t>(chunk_size, file_size - offset));
    chunks.push_back(ChunkDescriptor{index++, offset, size});
    offset += size;
  }
  return chunks;
}

Chunk FileChunker::read_chunk(uint32_t index, const crypto::ChecksumService& checksum) {
  if (index >= chunks_.size()) {
    throw std::out_of_range("Chunk index " + std::to_string(index) + " out of range");
  }
  const auto& descriptor = chunks_[index];

  Chunk chunk;
  chunk.index = index;
  chunk.size = descriptor.size;
  chunk.payload.resize(descriptor.size);

  if (descriptor.size > 0) {
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(descriptor.offset));
    file_.read(reinterpret_cast<char*>(chunk.payload.data()), static_cast<std::streamsize>(descriptor.size));
    if (static_cast<std::size_t>(file_.gcount()) != descriptor.size) {
      throw std::runtime_error("Source file changed while reading chunk " + std::to_string(index));
    }
  }

  chunk.checksum = checksum.digest(chunk.payload);
  return chunk;
}

} // namespace transfer
} // namespace bxfer
