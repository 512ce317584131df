#pragma once

#include <memory>
#include <string>

#include "nlohmann/json.hpp"
#include "pgshift/api/api_config.hpp"
#include "pgshift/api/control_plane.hpp"
#include "pgshift/http/http_client.hpp"

namespace pgshift::api {

/// @brief IControlPlane over the Heroku REST API.
class HerokuControlPlane : public IControlPlane {
public:
    explicit HerokuControlPlane(const ApiConfig& config);

    HerokuControlPlane(const HerokuControlPlane&) = delete;
    HerokuControlPlane& operator=(const HerokuControlPlane&) = delete;

    void set_maintenance(const std::string& app, bool enabled) override;
    ProcessCounts get_process_counts(const std::string& app) override;
    void set_process_count(const std::string& app, const std::string& type,
                           int count) override;
    AddonResult provision_addon(const std::string& app,
                                const std::string& addon) override;
    ConfigVars get_config_vars(const std::string& app) override;
    void put_config_vars(const std::string& app,
                         const ConfigVars& vars) override;

private:
    void call(http::verb method, const std::string& path,
              const http::QueryParams& query = {}) const;

    http::HttpClient client_;
};

// Counts running dynos per process type ("web.1", "web.2" -> web: 2)
ProcessCounts count_processes(const nlohmann::json& listing);

ConfigVars config_vars_from_json(const nlohmann::json& object);

std::unique_ptr<IControlPlane> make_heroku_control_plane(
    const ApiConfig& config);

}  // namespace pgshift::api
