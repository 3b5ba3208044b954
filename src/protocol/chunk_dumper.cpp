#include "chunkwire/protocol/chunk_dumper.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "chunkwire/protocol/message_ids.hpp"

namespace chunkwire::protocol {

namespace {

bool is_printable(std::uint8_t byte) { return byte >= 0x20 && byte < 0x7f; }

void indent(std::ostream& out, int depth) {
    out << std::string(static_cast<std::size_t>(depth) * 2, ' ');
}

void write_hex_byte(std::ostream& out, std::uint8_t byte) {
    out << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<unsigned>(byte) << std::dec << std::setfill(' ');
}

}  // namespace

ChunkDumper::ChunkDumper(DumpConfig config)
    : config_(std::move(config)), nested_tags_(config_.nested_tag_values()) {}

std::size_t ChunkDumper::dump(ByteSpan data, std::ostream& out) const {
    ChunkReader reader(data);
    std::size_t count = 0;
    for (const auto& chunk : reader) {
        dump_chunk(chunk.tag, chunk.payload, out, 0);
        ++count;
    }
    if (!reader.remaining().empty()) {
        dump_trailing(reader.remaining().size(), out, 0);
    }
    return count;
}

void ChunkDumper::dump_chunk(const Tag& tag, ByteSpan payload,
                             std::ostream& out, int depth) const {
    indent(out, depth);
    out << format_tag(tag) << " [" << payload.size() << "]";
    if (config_.show_names) {
        if (auto name = message_id_name(tag)) {
            out << " (" << *name << ")";
        }
    }

    if (is_nested(tag) && depth < config_.max_depth) {
        out << '\n';
        ChunkReader children(payload);
        for (const auto& child : children) {
            dump_chunk(child.tag, child.payload, out, depth + 1);
        }
        if (!children.remaining().empty()) {
            dump_trailing(children.remaining().size(), out, depth + 1);
        }
        return;
    }

    out << ' ' << format_payload(payload) << '\n';
}

void ChunkDumper::dump_trailing(std::size_t size, std::ostream& out,
                                int depth) {
    indent(out, depth);
    out << '<' << size << " trailing bytes>\n";
}

std::string ChunkDumper::format_tag(const Tag& tag) {
    std::ostringstream out;
    for (std::uint8_t byte : tag.bytes()) {
        if (is_printable(byte) && byte != '\\') {
            out << static_cast<char>(byte);
        } else {
            out << "\\x";
            write_hex_byte(out, byte);
        }
    }
    return out.str();
}

std::string ChunkDumper::format_payload(ByteSpan payload) const {
    bool truncated = false;
    if (config_.max_payload_preview != 0 &&
        payload.size() > config_.max_payload_preview) {
        payload = payload.first(config_.max_payload_preview);
        truncated = true;
    }

    std::ostringstream out;
    if (std::all_of(payload.begin(), payload.end(), is_printable)) {
        out << '"';
        for (std::uint8_t byte : payload) {
            if (byte == '"' || byte == '\\') {
                out << '\\';
            }
            out << static_cast<char>(byte);
        }
        out << '"';
    } else {
        for (std::size_t i = 0; i < payload.size(); ++i) {
            if (i != 0) {
                out << ' ';
            }
            write_hex_byte(out, payload[i]);
        }
    }
    if (truncated) {
        out << "...";
    }
    return out.str();
}

bool ChunkDumper::is_nested(const Tag& tag) const {
    return std::find(nested_tags_.begin(), nested_tags_.end(), tag) !=
           nested_tags_.end();
}

}  // namespace chunkwire::protocol
