#include "chunkwire/config/config.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <filesystem>
#include <stdexcept>
#include <utility>
#include <vector>

#include "chunkwire/log/logger.hpp"

namespace chunkwire::config {

namespace pt = boost::property_tree;

ConfigFormat format_from_path(const std::string& path) {
    const auto extension = std::filesystem::path(path).extension();
    if (extension == ".json") {
        return ConfigFormat::JSON;
    }
    if (extension == ".ini") {
        return ConfigFormat::INI;
    }
    return ConfigFormat::YAML;
}

bool ConfigurationProperties::read_string_list(const pt::ptree& tree,
                                               const std::string& path,
                                               std::vector<std::string>& out) {
    auto node = tree.get_child_optional(path);
    if (!node) {
        return false;
    }

    std::vector<std::string> items;
    if (node->empty()) {
        const std::string text = node->get_value<std::string>();
        boost::algorithm::split(items, text, boost::algorithm::is_any_of(","));
    } else {
        for (const auto& [key, child] : *node) {
            items.push_back(child.get_value<std::string>());
        }
    }

    out.clear();
    for (auto& item : items) {
        // Tags may legitimately end in a space ("STS "), so only trim the
        // separator side of comma lists.
        boost::algorithm::trim_left(item);
        if (!item.empty()) {
            out.push_back(std::move(item));
        }
    }
    return true;
}

pt::ptree ConfigManager::yaml_to_ptree(const YAML::Node& node) {
    pt::ptree tree;
    switch (node.Type()) {
        case YAML::NodeType::Map:
            for (const auto& entry : node) {
                tree.add_child(entry.first.as<std::string>(),
                               yaml_to_ptree(entry.second));
            }
            break;
        case YAML::NodeType::Sequence:
            for (const auto& element : node) {
                tree.push_back({"", yaml_to_ptree(element)});
            }
            break;
        case YAML::NodeType::Scalar:
            tree.put_value(node.Scalar());
            break;
        default:
            break;
    }
    return tree;
}

void ConfigManager::load_config(const std::string& config_file,
                                ConfigFormat format) {
    CHUNKWIRE_LOG_INFO << "Loading config file: " << config_file;
    try {
        pt::ptree tree;
        switch (format) {
            case ConfigFormat::YAML:
                tree = yaml_to_ptree(YAML::LoadFile(config_file));
                break;
            case ConfigFormat::JSON:
                pt::read_json(config_file, tree);
                break;
            case ConfigFormat::INI:
                pt::read_ini(config_file, tree);
                break;
        }
        apply_tree(std::move(tree));
    } catch (const std::exception& e) {
        CHUNKWIRE_LOG_ERROR << "Failed to load config file: " << config_file
                            << ", Error: " << e.what();
        throw std::runtime_error("Failed to load config file: " + config_file +
                                 ", Error: " + e.what());
    }
}

void ConfigManager::load_yaml_string(const std::string& content) {
    try {
        apply_tree(yaml_to_ptree(YAML::Load(content)));
    } catch (const std::exception& e) {
        CHUNKWIRE_LOG_ERROR << "Failed to load inline config: " << e.what();
        throw std::runtime_error(std::string("Failed to load inline config: ") +
                                 e.what());
    }
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
    tree_.clear();
}

void ConfigManager::apply_tree(pt::ptree tree) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::pair<ConfigurationProperties*,
                          std::unique_ptr<ConfigurationProperties>>>
        staged;
    for (const auto& [type, section] : sections_) {
        const std::string name = section->properties_name();
        auto subtree = tree.get_child_optional(name);
        if (!subtree) {
            CHUNKWIRE_LOG_WARN << "No '" << name
                               << "' section in configuration, using defaults";
            continue;
        }
        auto candidate = section->clone();
        try {
            candidate->from_ptree(*subtree);
            candidate->validate();
        } catch (const std::exception& e) {
            CHUNKWIRE_LOG_ERROR << "Invalid '" << name
                                << "' configuration: " << e.what();
            throw;
        }
        staged.emplace_back(section.get(), std::move(candidate));
    }

    for (auto& [section, candidate] : staged) {
        section->assign_from(*candidate);
        CHUNKWIRE_LOG_DEBUG << "Applied '" << section->properties_name()
                            << "' configuration";
    }
    tree_ = std::move(tree);
}

}  // namespace chunkwire::config
