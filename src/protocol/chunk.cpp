#include "chunkwire/protocol/chunk.hpp"

#include <algorithm>
#include <boost/endian/conversion.hpp>
#include <limits>
#include <type_traits>

namespace chunkwire::protocol {

Tag Tag::from_bytes(ByteSpan bytes) {
    if (bytes.size() != SIZE) {
        throw InvalidTag(bytes.size());
    }
    Tag tag;
    std::copy(bytes.begin(), bytes.end(), tag.bytes_.begin());
    return tag;
}

std::string Tag::str() const {
    return std::string(bytes_.begin(), bytes_.end());
}

Bytes to_bytes(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

namespace {

void append_chunks(Bytes& out, const Tag& tag, const Value& value) {
    Bytes chunk = make_chunk(tag, value);
    out.insert(out.end(), chunk.begin(), chunk.end());
}

}  // namespace

Bytes encode_value(const Value& value) {
    return std::visit(
        [](const auto& contents) -> Bytes {
            using T = std::decay_t<decltype(contents)>;
            if constexpr (std::is_same_v<T, Bytes>) {
                return contents;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return to_bytes(contents);
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return to_bytes(std::to_string(contents));
            } else if constexpr (std::is_same_v<T, Mapping>) {
                // std::map keeps tags in ascending byte order.
                Bytes out;
                for (const auto& [tag, child] : contents) {
                    append_chunks(out, tag, child);
                }
                return out;
            } else {
                static_assert(std::is_same_v<T, Sequence>,
                              "unhandled Value alternative");
                Bytes out;
                for (const auto& field : contents) {
                    append_chunks(out, field.tag, field.value);
                }
                return out;
            }
        },
        value.data);
}

Bytes make_chunk(const Tag& tag, const Value& value) {
    Bytes payload = encode_value(value);
    if (payload.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw PayloadTooLarge(payload.size());
    }

    Bytes chunk(ChunkHeader::SIZE + payload.size());
    std::copy(tag.bytes().begin(), tag.bytes().end(), chunk.begin());
    boost::endian::store_little_u32(chunk.data() + Tag::SIZE,
                                    static_cast<std::uint32_t>(payload.size()));
    std::copy(payload.begin(), payload.end(),
              chunk.begin() + ChunkHeader::SIZE);
    return chunk;
}

ChunkHeader extract_header(ByteSpan header) {
    if (header.size() != ChunkHeader::SIZE) {
        throw InvalidHeaderSize(header.size());
    }
    ChunkHeader result;
    result.tag = Tag::from_bytes(header.first(Tag::SIZE));
    result.length = boost::endian::load_little_u32(header.data() + Tag::SIZE);
    return result;
}

std::optional<ExtractedChunk> extract_chunk(ByteSpan data) {
    if (data.size() < ChunkHeader::SIZE) {
        return std::nullopt;  // Not enough data for header
    }

    ChunkHeader header = extract_header(data.first(ChunkHeader::SIZE));
    ByteSpan body = data.subspan(ChunkHeader::SIZE);
    if (header.length > body.size()) {
        return std::nullopt;  // Not enough data for full chunk
    }

    return ExtractedChunk{header.tag, body.first(header.length),
                          body.subspan(header.length)};
}

std::optional<ChunkView> ChunkReader::next() {
    if (finished_) {
        return std::nullopt;
    }
    auto chunk = extract_chunk(rest_);
    if (!chunk) {
        finished_ = true;
        return std::nullopt;
    }
    rest_ = chunk->rest;
    return ChunkView{chunk->tag, chunk->payload};
}

}  // namespace chunkwire::protocol
