#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace chunkwire::protocol {

// Base class for every failure raised by the chunk codec.
class ChunkError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A tag was built from a byte string that is not exactly 4 bytes long.
class InvalidTag : public ChunkError {
public:
    explicit InvalidTag(std::size_t actual_size)
        : ChunkError("Chunk tag must be exactly 4 bytes, got " +
                     std::to_string(actual_size)),
          actual_size_(actual_size) {}

    std::size_t actual_size() const noexcept { return actual_size_; }

private:
    std::size_t actual_size_;
};

// extract_header() was handed a slice that is not exactly 8 bytes.
class InvalidHeaderSize : public ChunkError {
public:
    explicit InvalidHeaderSize(std::size_t actual_size)
        : ChunkError("Chunk header must be exactly 8 bytes, got " +
                     std::to_string(actual_size)),
          actual_size_(actual_size) {}

    std::size_t actual_size() const noexcept { return actual_size_; }

private:
    std::size_t actual_size_;
};

// Dynamic input has a shape that no logical value alternative covers.
class UnsupportedValueType : public ChunkError {
public:
    explicit UnsupportedValueType(const std::string& shape)
        : ChunkError("Value must be bytes, text, integer, mapping or "
                     "sequence of tagged values, not " +
                     shape),
          shape_(shape) {}

    const std::string& shape() const noexcept { return shape_; }

private:
    std::string shape_;
};

// Encoded payload does not fit in the 32-bit length field.
class PayloadTooLarge : public ChunkError {
public:
    explicit PayloadTooLarge(std::size_t size)
        : ChunkError("Chunk payload of " + std::to_string(size) +
                     " bytes exceeds the 32-bit length field") {}
};

}  // namespace chunkwire::protocol
