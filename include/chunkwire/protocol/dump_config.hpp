#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "chunkwire/config/config.hpp"
#include "chunkwire/protocol/chunk.hpp"

namespace chunkwire::protocol {

// Settings for ChunkDumper, read from the "dump" config section.
class DumpConfig
    : public config::ClonableConfigurationProperties<DumpConfig> {
public:
    // Tags whose payloads are decoded again as nested chunks.
    std::vector<std::string> nested_tags = {"DLAY", "CMPU", "ANSR"};
    int max_depth = 8;
    std::size_t max_payload_preview = 64;
    bool show_names = true;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    std::string properties_name() const override { return "dump"; }

    // nested_tags converted to Tag values; throws InvalidTag on a bad entry.
    std::vector<Tag> nested_tag_values() const;

    // Parses "DLAY,CMPU" style lists, as accepted on the command line.
    static std::vector<std::string> split_tag_list(const std::string& list);
};

}  // namespace chunkwire::protocol
