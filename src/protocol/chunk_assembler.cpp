#include "chunkwire/protocol/chunk_assembler.hpp"

#include "chunkwire/log/logger.hpp"

namespace chunkwire::protocol {

namespace {
// Consumed prefix size that triggers moving the live bytes to the front.
constexpr std::size_t kCompactThreshold = 64 * 1024;
}  // namespace

void ChunkAssembler::append(ByteSpan data) {
    compact();
    buffer_.insert(buffer_.end(), data.begin(), data.end());
    CHUNKWIRE_LOG_TRACE << "ChunkAssembler buffered " << data.size()
                        << " bytes, " << buffered_size() << " pending";
}

std::optional<Chunk> ChunkAssembler::pop() {
    auto extracted = extract_chunk(buffered());
    if (!extracted) {
        return std::nullopt;
    }

    Chunk chunk{extracted->tag,
                Bytes(extracted->payload.begin(), extracted->payload.end())};
    offset_ += ChunkHeader::SIZE + chunk.payload.size();
    CHUNKWIRE_LOG_TRACE << "ChunkAssembler extracted chunk '"
                        << chunk.tag.str() << "' with "
                        << chunk.payload.size() << " payload bytes";
    return chunk;
}

void ChunkAssembler::clear() {
    if (!empty()) {
        CHUNKWIRE_LOG_DEBUG << "ChunkAssembler discarding " << buffered_size()
                            << " buffered bytes";
    }
    buffer_.clear();
    offset_ = 0;
}

void ChunkAssembler::compact() {
    if (offset_ == buffer_.size()) {
        buffer_.clear();
        offset_ = 0;
    } else if (offset_ >= kCompactThreshold) {
        buffer_.erase(buffer_.begin(),
                      buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
        offset_ = 0;
    }
}

}  // namespace chunkwire::protocol
