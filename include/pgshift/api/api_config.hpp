#pragma once

#include <string>

#include "pgshift/config/config.hpp"

namespace pgshift::api {

// Connection settings of the control plane API
class ApiConfig : public config::ConfigurationProperties {
public:
    std::string base_url = "https://api.heroku.com";
    std::string api_key;
    int timeout_seconds = 30;
    std::string user_agent = "pgshift";

    void from_ptree(const boost::property_tree::ptree& pt) override;
    YAML::Node to_yaml() const;
    void validate() const override;
    std::string properties_name() const override { return "api"; }

    // HEROKU_API_KEY takes precedence over the file
    void apply_environment();
};

}  // namespace pgshift::api
