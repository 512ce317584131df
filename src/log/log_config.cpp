#include "pgshift/log/log_config.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>

namespace pgshift::log {

namespace {

struct LevelName {
    const char* name;
    LogConfig::LogLevel level;
};

// Canonical names first; lookups by level take the first match
constexpr LevelName kLevelNames[] = {
    {"trace", LogConfig::LogLevel::TRACE},
    {"debug", LogConfig::LogLevel::DEBUG},
    {"info", LogConfig::LogLevel::INFO},
    {"warn", LogConfig::LogLevel::WARN},
    {"error", LogConfig::LogLevel::ERROR},
    {"fatal", LogConfig::LogLevel::FATAL},
    {"warning", LogConfig::LogLevel::WARN},
    {"critical", LogConfig::LogLevel::FATAL},
};

void read_sink(const boost::property_tree::ptree& pt, Sink& sink) {
    sink.enabled = pt.get("enabled", sink.enabled);
    sink.pattern = pt.get("pattern", sink.pattern);
}

YAML::Node write_sink(const Sink& sink) {
    YAML::Node node;
    node["enabled"] = sink.enabled;
    node["pattern"] = sink.pattern;
    return node;
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::invalid_argument(message);
    }
}

}  // namespace

FileSink LogConfig::default_file_sink() {
    FileSink sink;
    sink.pattern = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%";
    return sink;
}

void LogConfig::from_ptree(const boost::property_tree::ptree& pt) {
    if (auto level = get_optional_value<std::string>(pt, "global_level")) {
        global_level = level_from_string(*level);
    }
    if (auto node = pt.get_child_optional("console")) {
        read_sink(*node, console);
    }
    if (auto node = pt.get_child_optional("file")) {
        read_sink(*node, file);
        file.path = get_value(*node, "path", file.path);
        file.rotation_size =
            get_value(*node, "rotation_size", file.rotation_size);
        file.max_files = get_value(*node, "max_files", file.max_files);
    }
}

void LogConfig::validate() const {
    require(!console.enabled || !console.pattern.empty(),
            "log.console.pattern cannot be empty");
    if (!file.enabled) {
        return;
    }
    require(!file.pattern.empty(), "log.file.pattern cannot be empty");
    require(!file.path.empty(), "log.file.path cannot be empty");
    require(file.rotation_size > 0,
            "log.file.rotation_size must be greater than 0");
    require(file.max_files > 0, "log.file.max_files must be greater than 0");
}

YAML::Node LogConfig::to_yaml() const {
    YAML::Node node;
    node["global_level"] = level_to_string(global_level);
    node["console"] = write_sink(console);

    YAML::Node file_node = write_sink(file);
    file_node["path"] = file.path;
    file_node["rotation_size"] = file.rotation_size;
    file_node["max_files"] = file.max_files;
    node["file"] = file_node;
    return node;
}

LogConfig::LogLevel LogConfig::level_from_string(const std::string& name) {
    std::string lower;
    std::transform(name.begin(), name.end(), std::back_inserter(lower),
                   [](unsigned char c) { return std::tolower(c); });

    for (const auto& entry : kLevelNames) {
        if (lower == entry.name) {
            return entry.level;
        }
    }
    throw std::invalid_argument("Invalid log level: " + name);
}

std::string LogConfig::level_to_string(LogLevel level) {
    for (const auto& entry : kLevelNames) {
        if (entry.level == level) {
            return entry.name;
        }
    }
    return "info";
}

}  // namespace pgshift::log
