#define BOOST_TEST_MODULE ConfigTests
#include <boost/test/unit_test.hpp>
#include <filesystem>
#include <fstream>

#include "chunkwire/config/config.hpp"
#include "chunkwire/log/log_config.hpp"
#include "chunkwire/protocol/dump_config.hpp"

namespace fs = std::filesystem;

using chunkwire::config::ConfigFormat;
using chunkwire::config::ConfigManager;
using chunkwire::config::ConfigurationPropertiesFactory;
using chunkwire::log::LogConfig;
using chunkwire::protocol::DumpConfig;

// Creates a scratch directory and gives every test a clean ConfigManager.
struct ConfigFixture {
    const fs::path temp_dir = fs::temp_directory_path() / "chunkwire_test_configs";

    ConfigFixture() {
        fs::create_directories(temp_dir);
        ConfigManager::instance().reset();
    }

    ~ConfigFixture() {
        ConfigManager::instance().reset();
        fs::remove_all(temp_dir);
    }

    fs::path write_file(const std::string& filename,
                        const std::string& content) {
        fs::path file_path = temp_dir / filename;
        std::ofstream ofs(file_path.string());
        ofs << content;
        return file_path;
    }
};

BOOST_FIXTURE_TEST_SUITE(ConfigTestSuite, ConfigFixture)

BOOST_AUTO_TEST_CASE(test_load_yaml_sections) {
    auto dump = ConfigurationPropertiesFactory<DumpConfig>::create_and_register();
    auto log = ConfigurationPropertiesFactory<LogConfig>::create_and_register();

    fs::path path = write_file("chunkwire.yaml", R"(
log:
  global_level: error
  console:
    enabled: false
dump:
  nested_tags: [WRAP, "STS "]
  max_depth: 3
  show_names: false
)");

    BOOST_CHECK_NO_THROW(
        ConfigManager::instance().load_config(path.string(), ConfigFormat::YAML));

    BOOST_CHECK(log->global_level == LogConfig::LogLevel::ERROR);
    BOOST_CHECK(!log->console.enabled);

    BOOST_REQUIRE_EQUAL(dump->nested_tags.size(), 2u);
    BOOST_CHECK_EQUAL(dump->nested_tags[0], "WRAP");
    BOOST_CHECK_EQUAL(dump->nested_tags[1], "STS ");
    BOOST_CHECK_EQUAL(dump->max_depth, 3);
    BOOST_CHECK(!dump->show_names);
    BOOST_CHECK_EQUAL(dump->max_payload_preview, 64u);

    BOOST_CHECK(ConfigManager::instance()
                    .get_configuration_properties<DumpConfig>() == dump);
    BOOST_CHECK_EQUAL(
        ConfigManager::instance().get_config_tree().get<int>("dump.max_depth"),
        3);
}

BOOST_AUTO_TEST_CASE(test_missing_section_keeps_defaults) {
    auto dump = ConfigurationPropertiesFactory<DumpConfig>::create_and_register();
    ConfigManager::instance().load_yaml_string("other:\n  key: 1\n");

    BOOST_CHECK_EQUAL(dump->max_depth, 8);
    BOOST_CHECK_EQUAL(dump->nested_tags.size(), 3u);
    BOOST_CHECK(dump->show_names);
}

BOOST_AUTO_TEST_CASE(test_json_format) {
    auto dump = ConfigurationPropertiesFactory<DumpConfig>::create_and_register();
    fs::path path = write_file(
        "chunkwire.json",
        R"({"dump": {"nested_tags": "CMPU,ANSR", "max_payload_preview": 0}})");

    BOOST_CHECK(chunkwire::config::format_from_path(path.string()) ==
                ConfigFormat::JSON);
    ConfigManager::instance().load_config(path.string(), ConfigFormat::JSON);

    BOOST_REQUIRE_EQUAL(dump->nested_tags.size(), 2u);
    BOOST_CHECK_EQUAL(dump->nested_tags[1], "ANSR");
    BOOST_CHECK_EQUAL(dump->max_payload_preview, 0u);
}

BOOST_AUTO_TEST_CASE(test_comma_list_spacing) {
    auto dump = ConfigurationPropertiesFactory<DumpConfig>::create_and_register();
    ConfigManager::instance().load_yaml_string(
        "dump:\n  nested_tags: 'DLAY, STS ,,CMPU'\n");

    BOOST_REQUIRE_EQUAL(dump->nested_tags.size(), 3u);
    BOOST_CHECK_EQUAL(dump->nested_tags[0], "DLAY");
    BOOST_CHECK_EQUAL(dump->nested_tags[1], "STS ");
    BOOST_CHECK_EQUAL(dump->nested_tags[2], "CMPU");
}

BOOST_AUTO_TEST_CASE(test_ini_format) {
    auto dump = ConfigurationPropertiesFactory<DumpConfig>::create_and_register();
    fs::path path = write_file("chunkwire.ini", "[dump]\nmax_depth=1\n");

    BOOST_CHECK(chunkwire::config::format_from_path(path.string()) ==
                ConfigFormat::INI);
    ConfigManager::instance().load_config(path.string(), ConfigFormat::INI);
    BOOST_CHECK_EQUAL(dump->max_depth, 1);
}

BOOST_AUTO_TEST_CASE(test_invalid_values_rejected) {
    ConfigurationPropertiesFactory<DumpConfig>::create_and_register();
    fs::path path = write_file("bad.yaml", "dump:\n  nested_tags: [TOOLONG]\n");

    BOOST_CHECK_THROW(
        ConfigManager::instance().load_config(path.string(), ConfigFormat::YAML),
        std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_rejected_config_keeps_sections) {
    auto dump = ConfigurationPropertiesFactory<DumpConfig>::create_and_register();
    auto log = ConfigurationPropertiesFactory<LogConfig>::create_and_register();

    BOOST_CHECK_THROW(ConfigManager::instance().load_yaml_string(R"(
dump:
  nested_tags: [WRAP, TOOLONG]
  max_depth: 2
log:
  global_level: trace
  file:
    enabled: true
    max_files: 0
)"),
                      std::runtime_error);

    BOOST_REQUIRE_EQUAL(dump->nested_tags.size(), 3u);
    BOOST_CHECK_EQUAL(dump->nested_tags[0], "DLAY");
    BOOST_CHECK_EQUAL(dump->max_depth, 8);
    BOOST_CHECK(log->global_level == LogConfig::LogLevel::WARN);
    BOOST_CHECK(!log->file.enabled);
    BOOST_CHECK(ConfigManager::instance().get_config_tree().empty());
}

BOOST_AUTO_TEST_CASE(test_one_bad_section_blocks_all) {
    auto dump = ConfigurationPropertiesFactory<DumpConfig>::create_and_register();
    auto log = ConfigurationPropertiesFactory<LogConfig>::create_and_register();

    BOOST_CHECK_THROW(ConfigManager::instance().load_yaml_string(
                          "dump:\n  max_depth: 2\n"
                          "log:\n  file:\n    enabled: true\n"
                          "    max_files: 0\n"),
                      std::runtime_error);

    BOOST_CHECK_EQUAL(dump->max_depth, 8);
    BOOST_CHECK(!log->file.enabled);
}

BOOST_AUTO_TEST_CASE(test_invalid_log_level_rejected) {
    ConfigurationPropertiesFactory<LogConfig>::create_and_register();
    BOOST_CHECK_THROW(ConfigManager::instance().load_yaml_string(
                          "log:\n  global_level: loud\n"),
                      std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_missing_file) {
    BOOST_CHECK_THROW(ConfigManager::instance().load_config(
                          (temp_dir / "absent.yaml").string()),
                      std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_reset_clears_registrations) {
    ConfigurationPropertiesFactory<DumpConfig>::create_and_register();
    ConfigManager::instance().reset();
    BOOST_CHECK(!ConfigManager::instance()
                     .get_configuration_properties<DumpConfig>());
}

BOOST_AUTO_TEST_SUITE_END()
