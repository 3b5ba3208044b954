#include "chunkwire/protocol/value_yaml.hpp"

#include <charconv>
#include <string>

namespace chunkwire::protocol {

namespace {

const std::string kBinaryTag = "tag:yaml.org,2002:binary";
const std::string kIntTag = "tag:yaml.org,2002:int";
// yaml-cpp reports "?" for plain scalars without an explicit tag.
const std::string kNonSpecificTag = "?";

std::string node_type_name(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
            return "null";
        case YAML::NodeType::Scalar:
            return "scalar";
        case YAML::NodeType::Sequence:
            return "sequence";
        case YAML::NodeType::Map:
            return "map";
        case YAML::NodeType::Undefined:
        default:
            return "undefined";
    }
}

bool is_canonical_integer(const std::string& text) {
    std::size_t digits = text.size();
    std::size_t start = 0;
    if (!text.empty() && text[0] == '-') {
        start = 1;
        --digits;
    }
    if (digits == 0) {
        return false;
    }
    for (std::size_t i = start; i < text.size(); ++i) {
        if (text[i] < '0' || text[i] > '9') {
            return false;
        }
    }
    // "0" is canonical, "00", "012" and "-0" are not.
    if (text[start] == '0') {
        return digits == 1 && start == 0;
    }
    return true;
}

std::int64_t parse_integer(const std::string& text) {
    std::string_view digits = text;
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
    }
    std::int64_t result = 0;
    auto [ptr, ec] =
        std::from_chars(digits.data(), digits.data() + digits.size(), result);
    if (ec == std::errc::result_out_of_range) {
        throw UnsupportedValueType("integer '" + text +
                                   "' outside the 64-bit range");
    }
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        throw UnsupportedValueType("non-integer scalar '" + text +
                                   "' tagged !!int");
    }
    return result;
}

Value scalar_value(const YAML::Node& node) {
    const std::string& tag = node.Tag();
    if (tag == kBinaryTag) {
        YAML::Binary binary = node.as<YAML::Binary>();
        return Bytes(binary.data(), binary.data() + binary.size());
    }

    const std::string& text = node.Scalar();
    if (tag == kIntTag ||
        (tag == kNonSpecificTag && is_canonical_integer(text))) {
        return parse_integer(text);
    }
    return text;
}

Tag tag_from_key(const YAML::Node& key) {
    if (!key.IsScalar()) {
        throw UnsupportedValueType(node_type_name(key) + " used as a tag");
    }
    return Tag(key.Scalar());
}

}  // namespace

Value value_from_yaml(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return scalar_value(node);

        case YAML::NodeType::Map: {
            Mapping mapping;
            for (YAML::const_iterator it = node.begin(); it != node.end();
                 ++it) {
                mapping.insert_or_assign(tag_from_key(it->first),
                                         value_from_yaml(it->second));
            }
            return mapping;
        }

        case YAML::NodeType::Sequence: {
            Sequence sequence;
            sequence.reserve(node.size());
            for (YAML::const_iterator it = node.begin(); it != node.end();
                 ++it) {
                const YAML::Node& element = *it;
                if (!element.IsMap() || element.size() != 1) {
                    throw UnsupportedValueType(
                        "sequence element of type " + node_type_name(element) +
                        " (expected a single-entry map {TAG: value})");
                }
                auto entry = element.begin();
                sequence.push_back(Field{tag_from_key(entry->first),
                                         value_from_yaml(entry->second)});
            }
            return sequence;
        }

        default:
            throw UnsupportedValueType(node_type_name(node));
    }
}

Bytes stream_from_yaml(const YAML::Node& root) {
    if (!root.IsMap() && !root.IsSequence()) {
        throw UnsupportedValueType(node_type_name(root) +
                                   " at document root");
    }
    return encode_value(value_from_yaml(root));
}

}  // namespace chunkwire::protocol
