#pragma once

#include <string>

#include "pgshift/config/config.hpp"
#include "pgshift/saga/compensation_stack.hpp"

namespace pgshift::migration {

// Settings of the shared-database to dedicated-database migration
class MigrationConfig
    : public config::ConfigurationProperties {
public:
    struct RollbackConfig {
        int max_attempts = 3;
        int backoff_ms = 1000;
    };

    std::string source_config_var = "SHARED_DATABASE_URL";
    std::string database_addon = "heroku-postgresql:dev";
    std::string attachment_pattern = "^Attached as (HEROKU_POSTGRESQL_[A-Z]+)$";
    std::string backup_addon = "pgbackups:plus";
    std::string transfer_endpoint_var = "PGBACKUPS_URL";
    int poll_interval_ms = 1000;
    RollbackConfig rollback;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    YAML::Node to_yaml() const;
    void validate() const override;
    std::string properties_name() const override { return "migration"; }

    saga::RollbackPolicy rollback_policy() const;
};

}  // namespace pgshift::migration
