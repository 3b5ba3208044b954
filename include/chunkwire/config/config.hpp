#pragma once

#include <yaml-cpp/yaml.h>

#include <boost/property_tree/ptree.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace chunkwire::config {

enum class ConfigFormat { YAML, JSON, INI };

// .json and .ini select those parsers; every other extension reads as YAML.
ConfigFormat format_from_path(const std::string& path);

// One named section of the configuration file, e.g. "log" or "dump".
// ConfigManager hands each registered section its own subtree.
class ConfigurationProperties {
public:
    virtual ~ConfigurationProperties() = default;

    virtual std::string properties_name() const = 0;
    virtual void from_ptree(const boost::property_tree::ptree& pt) = 0;
    // Throws std::invalid_argument for values that cannot be used.
    virtual void validate() const {}

    virtual std::unique_ptr<ConfigurationProperties> clone() const = 0;
    // Overwrites this section with other, which must have the same type.
    virtual void assign_from(const ConfigurationProperties& other) = 0;

protected:
    template <typename T>
    static T value_or(const boost::property_tree::ptree& pt,
                      const std::string& path, const T& fallback) {
        return pt.get<T>(path, fallback);
    }

    template <typename T>
    static std::optional<T> optional_value(
        const boost::property_tree::ptree& pt, const std::string& path) {
        if (auto found = pt.get_optional<T>(path)) {
            return *found;
        }
        return std::nullopt;
    }

    // Accepts a sequence ([a, b]) or a comma-separated scalar ("a,b").
    // Returns false and leaves out untouched when path is absent.
    static bool read_string_list(const boost::property_tree::ptree& pt,
                                 const std::string& path,
                                 std::vector<std::string>& out);
};

// Implements clone() and assign_from() through the copy operations of Derived.
template <typename Derived>
class ClonableConfigurationProperties : public ConfigurationProperties {
public:
    std::unique_ptr<ConfigurationProperties> clone() const override {
        return std::make_unique<Derived>(static_cast<const Derived&>(*this));
    }

    void assign_from(const ConfigurationProperties& other) override {
        static_cast<Derived&>(*this) = static_cast<const Derived&>(other);
    }
};

// Process-wide registry of configuration sections and the tree they were
// last loaded from.
class ConfigManager {
public:
    static ConfigManager& instance() {
        static ConfigManager manager;
        return manager;
    }

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // Parses the file and refreshes every registered section. Sections are
    // only updated when all of them validate; any failure is rethrown as
    // std::runtime_error naming the file.
    void load_config(const std::string& config_file,
                     ConfigFormat format = ConfigFormat::YAML);
    void load_yaml_string(const std::string& content);

    template <typename T>
    void register_configuration_properties(std::shared_ptr<T> section) {
        static_assert(std::is_base_of_v<ConfigurationProperties, T>,
                      "configuration sections derive from "
                      "ConfigurationProperties");
        std::lock_guard<std::mutex> lock(mutex_);
        sections_[typeid(T)] = std::move(section);
    }

    template <typename T>
    std::shared_ptr<T> get_configuration_properties() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = sections_.find(typeid(T));
        return found == sections_.end()
                   ? nullptr
                   : std::static_pointer_cast<T>(found->second);
    }

    // Forgets all sections and the loaded tree.
    void reset();

    const boost::property_tree::ptree& get_config_tree() const { return tree_; }

    static boost::property_tree::ptree yaml_to_ptree(const YAML::Node& node);

private:
    ConfigManager() = default;

    void apply_tree(boost::property_tree::ptree tree);

    mutable std::mutex mutex_;
    std::unordered_map<std::type_index,
                       std::shared_ptr<ConfigurationProperties>>
        sections_;
    boost::property_tree::ptree tree_;
};

template <typename T>
class ConfigurationPropertiesFactory {
public:
    static std::shared_ptr<T> create_and_register() {
        auto section = std::make_shared<T>();
        ConfigManager::instance().register_configuration_properties(section);
        return section;
    }
};

}  // namespace chunkwire::config
