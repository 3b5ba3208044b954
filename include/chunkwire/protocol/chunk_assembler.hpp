#pragma once

#include <cstddef>
#include <optional>

#include "chunkwire/protocol/chunk.hpp"

namespace chunkwire::protocol {

// A decoded chunk that owns its payload.
struct Chunk {
    Tag tag;
    Bytes payload;
};

// Accumulates bytes arriving in arbitrary fragments (e.g. successive socket
// or file reads) and hands out complete chunks as soon as they are buffered.
// Incomplete data is kept until more bytes arrive; nothing is ever rejected.
class ChunkAssembler {
public:
    void append(ByteSpan data);

    // Removes and returns the next complete chunk, or std::nullopt if the
    // buffer does not hold one yet.
    std::optional<Chunk> pop();

    std::size_t buffered_size() const { return buffer_.size() - offset_; }
    bool empty() const { return buffered_size() == 0; }

    // Unconsumed bytes, e.g. the trailing garbage at end of stream.
    ByteSpan buffered() const {
        return ByteSpan(buffer_).subspan(offset_);
    }

    void clear();

private:
    void compact();

    Bytes buffer_;
    std::size_t offset_ = 0;
};

}  // namespace chunkwire::protocol
