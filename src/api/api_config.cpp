#include "pgshift/api/api_config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace pgshift::api {

void ApiConfig::from_ptree(const boost::property_tree::ptree& pt) {
    base_url = get_value(pt, "base_url", base_url);
    api_key = get_value(pt, "api_key", api_key);
    timeout_seconds = get_value(pt, "timeout_seconds", timeout_seconds);
    user_agent = get_value(pt, "user_agent", user_agent);
}

YAML::Node ApiConfig::to_yaml() const {
    YAML::Node node;
    node["base_url"] = base_url;
    node["api_key"] = api_key;
    node["timeout_seconds"] = timeout_seconds;
    node["user_agent"] = user_agent;
    return node;
}

void ApiConfig::validate() const {
    if (base_url.empty()) {
        throw std::invalid_argument("api.base_url cannot be empty");
    }
    if (timeout_seconds <= 0) {
        throw std::invalid_argument(
            "api.timeout_seconds must be greater than 0");
    }
}

void ApiConfig::apply_environment() {
    if (const char* key = std::getenv("HEROKU_API_KEY")) {
        if (*key != '\0') {
            api_key = key;
        }
    }
}

}  // namespace pgshift::api
