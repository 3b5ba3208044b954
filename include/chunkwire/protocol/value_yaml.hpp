#pragma once

#include <yaml-cpp/yaml.h>

#include "chunkwire/protocol/chunk.hpp"

namespace chunkwire::protocol {

// Builds a logical value from a YAML node.
//
//   !!binary scalar          -> bytes (base64 decoded)
//   !!int or plain integer   -> integer
//   any other scalar         -> text
//   map                      -> mapping, keys must be 4-character tags
//   sequence                 -> sequence, each element a one-entry map
//                               {TAG: value}
//
// Throws UnsupportedValueType for null nodes, malformed sequence elements and
// integers outside the 64-bit range, and InvalidTag for bad keys.
Value value_from_yaml(const YAML::Node& node);

// Encodes a whole document as a chunk stream. The root must be a map (chunks
// in tag order) or a sequence of one-entry maps (chunks in document order).
Bytes stream_from_yaml(const YAML::Node& root);

}  // namespace chunkwire::protocol
