#pragma once

#include <cstdint>
#include <string>

#include "pgshift/config/config.hpp"

namespace pgshift::log {

struct Sink {
    bool enabled = false;
    std::string pattern;
};

// Rotated by size and at midnight
struct FileSink : Sink {
    std::string path = "logs/pgshift.log";
    int64_t rotation_size = 10 * 1024 * 1024;
    int max_files = 5;
};

/**
 * @brief Settings of the `log` section.
 *
 * Patterns use the Boost.Log formatter syntax, e.g.
 * "[%TimeStamp%] [%Severity%] %Message%".
 */
class LogConfig : public config::ConfigurationProperties {
public:
    enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

    LogLevel global_level = LogLevel::INFO;
    Sink console{true, "%Message%"};
    FileSink file = default_file_sink();

    std::string properties_name() const override { return "log"; }
    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    YAML::Node to_yaml() const;

    /// @throws std::invalid_argument for an unknown name. Accepts "warning"
    /// and "critical" as aliases, in any case.
    static LogLevel level_from_string(const std::string& name);
    static std::string level_to_string(LogLevel level);

private:
    static FileSink default_file_sink();
};

}  // namespace pgshift::log
