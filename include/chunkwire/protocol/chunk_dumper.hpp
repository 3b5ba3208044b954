#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "chunkwire/protocol/chunk.hpp"
#include "chunkwire/protocol/dump_config.hpp"

namespace chunkwire::protocol {

// Renders chunk streams as an indented tree, one chunk per line:
//
//   DLAY [9] (request_delay)
//     NTVL [1] (interval) "5"
//
// Payloads of the configured nested tags are decoded again as chunks, down to
// max_depth levels. Other payloads are shown quoted when printable and as hex
// otherwise, cut after max_payload_preview bytes (0 means no limit).
class ChunkDumper {
public:
    explicit ChunkDumper(DumpConfig config = {});

    // Writes every complete chunk in data and a note for trailing bytes.
    // Returns the number of top-level chunks written.
    std::size_t dump(ByteSpan data, std::ostream& out) const;

    void dump_chunk(const Tag& tag, ByteSpan payload, std::ostream& out,
                    int depth = 0) const;

    static void dump_trailing(std::size_t size, std::ostream& out,
                              int depth = 0);

    static std::string format_tag(const Tag& tag);
    std::string format_payload(ByteSpan payload) const;

    const DumpConfig& config() const { return config_; }

private:
    bool is_nested(const Tag& tag) const;

    DumpConfig config_;
    std::vector<Tag> nested_tags_;
};

}  // namespace chunkwire::protocol
