// tests/support/fakes.hpp
#pragma once

#include <algorithm>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "pgshift/api/control_plane.hpp"
#include "pgshift/migration/migration_context.hpp"

namespace pgshift::testing {

constexpr const char* kSourceUrl = "postgres://shared.example.com/app_db";
constexpr const char* kNewUrl = "postgres://dedicated.example.com/red";
constexpr const char* kBackupsUrl = "https://u:p@pgbackups.example.com/client";

// In-memory control plane recording every call
class FakeControlPlane : public api::IControlPlane {
public:
    FakeControlPlane() {
        config["SHARED_DATABASE_URL"] = kSourceUrl;
        config["DATABASE_URL"] = kSourceUrl;
        config["PGBACKUPS_URL"] = kBackupsUrl;
        config["OTHER_VAR"] = "unrelated";
        processes = {{"web", 2}, {"worker", 1}};
    }

    bool maintenance = false;
    api::ProcessCounts processes;
    api::ConfigVars config;
    std::set<std::string> addons{"pgbackups:plus"};
    std::string attachment_message = "Attached as HEROKU_POSTGRESQL_RED";
    std::vector<std::string> calls;

    // Makes the next `times` calls of `operation` throw
    void fail(const std::string& operation, int times = 1) {
        failures_[operation] = times;
    }

    // Makes set_process_count fail for one process type only
    void fail_scaling(const std::string& type) { failing_type_ = type; }

    size_t mutations() const {
        size_t count = 0;
        for (const auto& call : calls) {
            if (call.rfind("get_", 0) != 0) {
                ++count;
            }
        }
        return count;
    }

    void set_maintenance(const std::string&, bool enabled) override {
        record("set_maintenance");
        maintenance = enabled;
    }

    api::ProcessCounts get_process_counts(const std::string&) override {
        record("get_process_counts");
        return processes;
    }

    void set_process_count(const std::string&, const std::string& type,
                           int count) override {
        record("set_process_count");
        if (type == failing_type_) {
            throw std::runtime_error("cannot scale " + type);
        }
        processes[type] = count;
    }

    api::AddonResult provision_addon(const std::string&,
                                     const std::string& addon) override {
        record("provision_addon");
        if (!addons.insert(addon).second) {
            throw api::AddonConflictError(422, "Add-on already installed.");
        }
        if (addon.rfind("heroku-postgresql", 0) == 0) {
            config["HEROKU_POSTGRESQL_RED"] = kNewUrl;
            return {attachment_message};
        }
        if (addon.rfind("pgbackups", 0) == 0) {
            config["PGBACKUPS_URL"] = kBackupsUrl;
        }
        return {};
    }

    api::ConfigVars get_config_vars(const std::string&) override {
        record("get_config_vars");
        return config;
    }

    void put_config_vars(const std::string&,
                         const api::ConfigVars& vars) override {
        record("put_config_vars");
        for (const auto& [name, value] : vars) {
            config[name] = value;
        }
    }

private:
    void record(const std::string& operation) {
        calls.push_back(operation);
        auto it = failures_.find(operation);
        if (it != failures_.end() && it->second > 0) {
            --it->second;
            throw api::ApiError(503, operation + " unavailable");
        }
    }

    std::map<std::string, int> failures_;
    std::string failing_type_;
};

// Transfer service replaying a scripted list of states
class FakeTransferService : public api::ITransferService {
public:
    std::vector<api::Transfer> states;  // returned in order, last one repeats
    std::vector<std::string> endpoints;
    std::string from_url, from_name, to_url, to_name;
    size_t gets = 0;

    static api::Transfer pending(const std::string& log = "") {
        return api::Transfer{"42", log, std::nullopt, std::nullopt};
    }
    static api::Transfer finished(const std::string& log = "done") {
        return api::Transfer{"42", log, std::nullopt, "2012-05-01T00:00:00Z"};
    }
    static api::Transfer errored(const std::string& log) {
        return api::Transfer{"42", log, "2012-05-01T00:00:00Z", std::nullopt};
    }

    api::Transfer create_transfer(const std::string& from,
                                  const std::string& from_label,
                                  const std::string& to,
                                  const std::string& to_label) override {
        from_url = from;
        from_name = from_label;
        to_url = to;
        to_name = to_label;
        return pending("started");
    }

    api::Transfer get_transfer(const std::string&) override {
        if (states.empty()) {
            return finished();
        }
        auto index = std::min(gets, states.size() - 1);
        ++gets;
        return states[index];
    }
};

// Hands out a client forwarding to a shared fake
class ForwardingTransferService : public api::ITransferService {
public:
    explicit ForwardingTransferService(
        std::shared_ptr<FakeTransferService> target)
        : target_(std::move(target)) {}

    api::Transfer create_transfer(const std::string& from_url,
                                  const std::string& from_name,
                                  const std::string& to_url,
                                  const std::string& to_name) override {
        return target_->create_transfer(from_url, from_name, to_url, to_name);
    }
    api::Transfer get_transfer(const std::string& id) override {
        return target_->get_transfer(id);
    }

private:
    std::shared_ptr<FakeTransferService> target_;
};

inline api::TransferServiceFactory make_factory(
    std::shared_ptr<FakeTransferService> service) {
    return [service](const std::string& endpoint) {
        service->endpoints.push_back(endpoint);
        return std::unique_ptr<api::ITransferService>(
            std::make_unique<ForwardingTransferService>(service));
    };
}

inline migration::MigrationContext make_context(
    std::shared_ptr<FakeControlPlane> api,
    std::shared_ptr<FakeTransferService> transfers,
    saga::CancellationToken& token) {
    migration::MigrationContext context;
    context.api = std::move(api);
    context.app = "example-app";
    context.settings.poll_interval_ms = 0;
    context.settings.rollback.max_attempts = 1;
    context.settings.rollback.backoff_ms = 0;
    context.transfer_service = make_factory(std::move(transfers));
    context.token = &token;
    return context;
}

}  // namespace pgshift::testing
