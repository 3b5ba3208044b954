#include "chunkwire/protocol/dump_config.hpp"

#include <algorithm>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <stdexcept>

namespace chunkwire::protocol {

void DumpConfig::from_ptree(const boost::property_tree::ptree& pt) {
    read_string_list(pt, "nested_tags", nested_tags);
    max_depth = value_or(pt, "max_depth", max_depth);
    max_payload_preview =
        value_or(pt, "max_payload_preview", max_payload_preview);
    show_names = value_or(pt, "show_names", show_names);
}

void DumpConfig::validate() const {
    if (max_depth < 0) {
        throw std::invalid_argument("dump max_depth must not be negative");
    }
    for (const auto& tag : nested_tags) {
        if (tag.size() != Tag::SIZE) {
            throw std::invalid_argument("dump nested tag '" + tag +
                                        "' must be exactly 4 bytes");
        }
    }
}

std::vector<Tag> DumpConfig::nested_tag_values() const {
    std::vector<Tag> tags;
    tags.reserve(nested_tags.size());
    for (const auto& tag : nested_tags) {
        tags.emplace_back(tag);
    }
    return tags;
}

std::vector<std::string> DumpConfig::split_tag_list(const std::string& list) {
    std::vector<std::string> parts;
    boost::algorithm::split(parts, list, boost::algorithm::is_any_of(","));
    parts.erase(std::remove(parts.begin(), parts.end(), std::string()),
                parts.end());
    return parts;
}

}  // namespace chunkwire::protocol
