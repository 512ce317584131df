#include "pgshift/api/heroku_control_plane.hpp"

#include <algorithm>
#include <cctype>

#include "pgshift/log/logger.hpp"

namespace pgshift::api {

namespace {

std::string app_path(const std::string& app) { return "/apps/" + app; }

bool mentions_already_installed(const std::string& message) {
    std::string lower = message;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower.find("already") != std::string::npos;
}

}  // namespace

HerokuControlPlane::HerokuControlPlane(const ApiConfig& config)
    : client_(config.base_url, std::chrono::seconds(config.timeout_seconds),
              config.user_agent) {
    if (!config.api_key.empty()) {
        client_.set_basic_auth("", config.api_key);
    }
}

void HerokuControlPlane::call(http::verb method, const std::string& path,
                              const http::QueryParams& query) const {
    auto response = client_.send(method, path, query);
    if (!response.ok()) {
        throw ApiError(response.status, http::error_message(response),
                       response.body);
    }
}

void HerokuControlPlane::set_maintenance(const std::string& app,
                                         bool enabled) {
    call(http::verb::post, app_path(app) + "/server/maintenance",
         {{"maintenance_mode", enabled ? "1" : "0"}});
}

ProcessCounts HerokuControlPlane::get_process_counts(const std::string& app) {
    return count_processes(
        client_.send_json(http::verb::get, app_path(app) + "/ps"));
}

void HerokuControlPlane::set_process_count(const std::string& app,
                                           const std::string& type,
                                           int count) {
    call(http::verb::post, app_path(app) + "/ps/scale",
         {{"type", type}, {"qty", std::to_string(count)}});
}

AddonResult HerokuControlPlane::provision_addon(const std::string& app,
                                                const std::string& addon) {
    nlohmann::json body;
    try {
        body = client_.send_json(http::verb::post,
                                 app_path(app) + "/addons/" + addon);
    } catch (const ApiError& e) {
        if ((e.status() == 422 || e.status() == 409) &&
            mentions_already_installed(e.what())) {
            PGSHIFT_LOG_DEBUG << addon << " already present on " << app;
            throw AddonConflictError(e.status(), e.what(), e.body());
        }
        throw;
    }

    AddonResult result;
    if (body.is_object()) {
        auto it = body.find("message");
        if (it != body.end() && it->is_string()) {
            result.message = it->get<std::string>();
        }
    }
    return result;
}

ConfigVars HerokuControlPlane::get_config_vars(const std::string& app) {
    return config_vars_from_json(
        client_.send_json(http::verb::get, app_path(app) + "/config_vars"));
}

void HerokuControlPlane::put_config_vars(const std::string& app,
                                         const ConfigVars& vars) {
    nlohmann::json body = nlohmann::json::object();
    for (const auto& [name, value] : vars) {
        body[name] = value;
    }
    client_.send_json(http::verb::put, app_path(app) + "/config_vars", {},
                      &body);
}

ProcessCounts count_processes(const nlohmann::json& listing) {
    ProcessCounts counts;
    if (!listing.is_array()) {
        throw ApiError(200, "Unexpected process listing format",
                       listing.dump());
    }

    for (const auto& entry : listing) {
        auto it = entry.find("process");
        if (it == entry.end() || !it->is_string()) {
            continue;
        }
        const auto process = it->get<std::string>();
        const auto name = process.substr(0, process.find('.'));
        ++counts[name];
    }
    return counts;
}

ConfigVars config_vars_from_json(const nlohmann::json& object) {
    ConfigVars vars;
    if (!object.is_object()) {
        throw ApiError(200, "Unexpected config vars format", object.dump());
    }

    for (auto& [name, value] : object.items()) {
        if (value.is_null()) {
            continue;
        }
        vars[name] = value.is_string() ? value.get<std::string>() : value.dump();
    }
    return vars;
}

std::unique_ptr<IControlPlane> make_heroku_control_plane(
    const ApiConfig& config) {
    return std::make_unique<HerokuControlPlane>(config);
}

}  // namespace pgshift::api
