#include "pgshift/config/config.hpp"

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <filesystem>
#include <stdexcept>

#include "pgshift/log/logger.hpp"

namespace pgshift::config {

ConfigFormat format_from_path(const std::string& path) {
    const auto extension = std::filesystem::path(path).extension().string();
    if (extension == ".json") return ConfigFormat::JSON;
    if (extension == ".ini") return ConfigFormat::INI;
    return ConfigFormat::YAML;
}

ConfigManager& ConfigManager::instance() {
    static ConfigManager manager;
    return manager;
}

void ConfigManager::add_section(
    std::shared_ptr<ConfigurationProperties> section) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto name = section->properties_name();
    for (const auto& bound : sections_) {
        if (bound->properties_name() == name) {
            throw std::logic_error("Configuration section '" + name +
                                   "' is already bound");
        }
    }
    sections_.push_back(std::move(section));
}

boost::property_tree::ptree ConfigManager::yaml_to_ptree(
    const YAML::Node& node) {
    boost::property_tree::ptree pt;
    switch (node.Type()) {
        case YAML::NodeType::Map:
            for (const auto& entry : node) {
                pt.add_child(entry.first.as<std::string>(),
                             yaml_to_ptree(entry.second));
            }
            break;
        case YAML::NodeType::Sequence:
            for (const auto& element : node) {
                pt.push_back({"", yaml_to_ptree(element)});
            }
            break;
        case YAML::NodeType::Scalar:
            pt.put_value(node.Scalar());
            break;
        default:
            break;
    }
    return pt;
}

boost::property_tree::ptree ConfigManager::read_tree(const std::string& path,
                                                     ConfigFormat format) {
    boost::property_tree::ptree tree;
    if (format == ConfigFormat::JSON) {
        boost::property_tree::read_json(path, tree);
    } else if (format == ConfigFormat::INI) {
        boost::property_tree::read_ini(path, tree);
    } else {
        tree = yaml_to_ptree(YAML::LoadFile(path));
    }
    return tree;
}

void ConfigManager::load_file(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Configuration file not found: " + path);
    }

    PGSHIFT_LOG_DEBUG << "Loading configuration from " << path;
    try {
        apply(read_tree(path, format_from_path(path)));
    } catch (const std::exception& e) {
        PGSHIFT_LOG_ERROR << "Invalid configuration in " << path << ": "
                          << e.what();
        throw std::runtime_error("Invalid configuration in " + path + ": " +
                                 e.what());
    }
}

void ConfigManager::load_defaults() { apply(boost::property_tree::ptree()); }

void ConfigManager::apply(const boost::property_tree::ptree& tree) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& section : sections_) {
        const auto name = section->properties_name();
        if (auto child = tree.get_child_optional(name)) {
            section->from_ptree(*child);
        } else {
            PGSHIFT_LOG_TRACE << "No '" << name << "' section, using defaults";
        }
        section->validate();
    }
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
}

size_t ConfigManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sections_.size();
}

}  // namespace pgshift::config
