#pragma once

#include <yaml-cpp/yaml.h>

#include <boost/property_tree/ptree.hpp>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace pgshift::config {

// Read when --config is not given; a missing default file is not an error
inline constexpr const char* DEFAULT_CONFIG_FILE = "config/pgshift.yaml";

enum class ConfigFormat { YAML, JSON, INI };

// Picks the format from a file extension, YAML when unknown
ConfigFormat format_from_path(const std::string& path);

/**
 * @brief One top-level section of the configuration file.
 *
 * Members hold the defaults until a file with a section named
 * properties_name() is loaded.
 */
class ConfigurationProperties {
public:
    virtual ~ConfigurationProperties() = default;

    virtual std::string properties_name() const = 0;

    // Only called when the section is present in the file
    virtual void from_ptree(const boost::property_tree::ptree& pt) = 0;

    // Called after every load, with or without a section
    virtual void validate() const {}

protected:
    template <typename T>
    static T get_value(const boost::property_tree::ptree& pt,
                       const std::string& path, const T& default_value) {
        return pt.get<T>(path, default_value);
    }

    template <typename T>
    static std::optional<T> get_optional_value(
        const boost::property_tree::ptree& pt, const std::string& path) {
        if (auto value = pt.get_optional<T>(path)) {
            return *value;
        }
        return std::nullopt;
    }
};

/// @brief Process-wide set of bound configuration sections.
class ConfigManager {
public:
    static ConfigManager& instance();

    /// @brief Creates a section holding its defaults; later loads fill it.
    /// @throws std::logic_error if a section with the same name is bound.
    template <typename T>
    std::shared_ptr<T> bind() {
        static_assert(std::is_base_of_v<ConfigurationProperties, T>,
                      "T must inherit from ConfigurationProperties");
        auto section = std::make_shared<T>();
        add_section(section);
        return section;
    }

    /// @brief Reads the file and applies it to every bound section.
    /// @throws std::runtime_error if the file is missing or unreadable, or a
    /// section rejects its values.
    void load_file(const std::string& path);

    // Validates every bound section against its defaults
    void load_defaults();

    // Forgets every bound section
    void reset();

    size_t size() const;

    static boost::property_tree::ptree read_tree(const std::string& path,
                                                 ConfigFormat format);
    static boost::property_tree::ptree yaml_to_ptree(const YAML::Node& node);

private:
    ConfigManager() = default;

    void add_section(std::shared_ptr<ConfigurationProperties> section);
    void apply(const boost::property_tree::ptree& tree);

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<ConfigurationProperties>> sections_;
};

}  // namespace pgshift::config
