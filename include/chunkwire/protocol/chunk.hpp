#pragma once

#include <array>
#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "chunkwire/protocol/chunk_errors.hpp"

namespace chunkwire::protocol {

using Bytes = std::vector<std::uint8_t>;
using ByteSpan = std::span<const std::uint8_t>;

// 4-byte opaque chunk identifier. Ordering is by raw byte value.
class Tag {
public:
    static constexpr std::size_t SIZE = 4;

    constexpr Tag() = default;

    constexpr explicit Tag(std::string_view code) {
        if (code.size() != SIZE) {
            throw InvalidTag(code.size());
        }
        for (std::size_t i = 0; i < SIZE; ++i) {
            bytes_[i] = static_cast<std::uint8_t>(code[i]);
        }
    }

    static Tag from_bytes(ByteSpan bytes);

    const std::array<std::uint8_t, SIZE>& bytes() const { return bytes_; }

    // Raw tag bytes as a std::string (not necessarily printable).
    std::string str() const;

    auto operator<=>(const Tag&) const = default;

private:
    std::array<std::uint8_t, SIZE> bytes_{};
};

struct Value;
struct Field;

// Children are always emitted in ascending tag order.
using Mapping = std::map<Tag, Value>;
// Children are emitted in insertion order.
using Sequence = std::vector<Field>;

// Logical value accepted by the encoder. Text is UTF-8 and written verbatim;
// integers are written as canonical decimal ASCII.
struct Value {
    using Storage =
        std::variant<Bytes, std::string, std::int64_t, Mapping, Sequence>;

    Storage data;

    Value() = default;
    Value(Bytes bytes) : data(std::move(bytes)) {}
    Value(std::string text) : data(std::move(text)) {}
    Value(std::string_view text) : data(std::string(text)) {}
    Value(const char* text) : data(std::string(text)) {}
    template <std::integral T>
        requires(!std::same_as<T, bool> && !std::same_as<T, char> &&
                 (std::is_signed_v<T> || sizeof(T) < sizeof(std::int64_t)))
    Value(T number) : data(static_cast<std::int64_t>(number)) {}
    // Throws UnsupportedValueType above INT64_MAX.
    template <std::unsigned_integral T>
        requires(sizeof(T) >= sizeof(std::int64_t))
    Value(T number) : data(checked_int64(number)) {}
    Value(Mapping mapping) : data(std::move(mapping)) {}
    Value(Sequence sequence) : data(std::move(sequence)) {}

    template <typename T>
    bool holds() const {
        return std::holds_alternative<T>(data);
    }

private:
    template <std::unsigned_integral T>
    static std::int64_t checked_int64(T number) {
        if (number >
            static_cast<T>(std::numeric_limits<std::int64_t>::max())) {
            throw UnsupportedValueType("integer '" + std::to_string(number) +
                                       "' outside the 64-bit range");
        }
        return static_cast<std::int64_t>(number);
    }
};

struct Field {
    Tag tag;
    Value value;
};

// Fixed 8-byte chunk header: tag followed by little-endian uint32 length.
struct ChunkHeader {
    static constexpr std::size_t SIZE = 8;

    Tag tag;
    std::uint32_t length = 0;
};

// One decoded chunk. The payload aliases the decoded buffer.
struct ChunkView {
    Tag tag;
    ByteSpan payload;
};

struct ExtractedChunk {
    Tag tag;
    ByteSpan payload;
    ByteSpan rest;
};

// Converts a logical value into chunk payload bytes, without a header.
Bytes encode_value(const Value& value);

// Produces a complete chunk: header followed by the encoded payload.
// Throws PayloadTooLarge when the payload does not fit the length field.
Bytes make_chunk(const Tag& tag, const Value& value);

// Parses exactly 8 bytes into tag and length.
// Throws InvalidHeaderSize for any other input size.
ChunkHeader extract_header(ByteSpan header);

// Parses one chunk from the front of data. Returns std::nullopt when data
// holds less than one complete chunk; this is never treated as an error.
std::optional<ExtractedChunk> extract_chunk(ByteSpan data);

// Cursor over the chunks of a buffer. next() yields (tag, payload) pairs
// until no complete chunk remains; remaining() exposes what was not parsed.
// The reader does not own the buffer.
class ChunkReader {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = ChunkView;
        using difference_type = std::ptrdiff_t;
        using pointer = const ChunkView*;
        using reference = const ChunkView&;

        iterator() = default;
        explicit iterator(ChunkReader* reader) : reader_(reader) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            advance();
            return *this;
        }
        void operator++(int) { advance(); }

        bool operator==(const iterator& other) const {
            return !current_ && !other.current_;
        }

    private:
        void advance() {
            current_ = reader_ ? reader_->next() : std::nullopt;
        }

        ChunkReader* reader_ = nullptr;
        std::optional<ChunkView> current_;
    };

    explicit ChunkReader(ByteSpan data) : data_(data), rest_(data) {}

    std::optional<ChunkView> next();

    // Bytes not yet consumed by next().
    ByteSpan remaining() const { return rest_; }

    bool done() const { return finished_; }

    void reset() {
        rest_ = data_;
        finished_ = false;
    }

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    ByteSpan data_;
    ByteSpan rest_;
    bool finished_ = false;
};

// Lazily walks every complete chunk in data.
inline ChunkReader extract_iter(ByteSpan data) { return ChunkReader(data); }

// Convenience for building byte buffers from literals in text form.
Bytes to_bytes(std::string_view text);

}  // namespace chunkwire::protocol
