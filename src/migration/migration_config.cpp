#include "pgshift/migration/migration_config.hpp"

#include <regex>
#include <stdexcept>

namespace pgshift::migration {

void MigrationConfig::from_ptree(const boost::property_tree::ptree& pt) {
    source_config_var =
        get_value(pt, "source_config_var", source_config_var);
    database_addon = get_value(pt, "database_addon", database_addon);
    attachment_pattern =
        get_value(pt, "attachment_pattern", attachment_pattern);
    backup_addon = get_value(pt, "backup_addon", backup_addon);
    transfer_endpoint_var =
        get_value(pt, "transfer_endpoint_var", transfer_endpoint_var);
    poll_interval_ms = get_value(pt, "poll_interval_ms", poll_interval_ms);

    if (auto rollback_pt = pt.get_child_optional("rollback")) {
        rollback.max_attempts =
            get_value(*rollback_pt, "max_attempts", rollback.max_attempts);
        rollback.backoff_ms =
            get_value(*rollback_pt, "backoff_ms", rollback.backoff_ms);
    }
}

YAML::Node MigrationConfig::to_yaml() const {
    YAML::Node node;
    node["source_config_var"] = source_config_var;
    node["database_addon"] = database_addon;
    node["attachment_pattern"] = attachment_pattern;
    node["backup_addon"] = backup_addon;
    node["transfer_endpoint_var"] = transfer_endpoint_var;
    node["poll_interval_ms"] = poll_interval_ms;
    node["rollback"]["max_attempts"] = rollback.max_attempts;
    node["rollback"]["backoff_ms"] = rollback.backoff_ms;
    return node;
}

void MigrationConfig::validate() const {
    if (source_config_var.empty()) {
        throw std::invalid_argument(
            "migration.source_config_var cannot be empty");
    }
    if (database_addon.empty() || backup_addon.empty()) {
        throw std::invalid_argument("migration add-on names cannot be empty");
    }
    if (transfer_endpoint_var.empty()) {
        throw std::invalid_argument(
            "migration.transfer_endpoint_var cannot be empty");
    }
    if (poll_interval_ms < 0) {
        throw std::invalid_argument(
            "migration.poll_interval_ms cannot be negative");
    }
    if (rollback.max_attempts <= 0) {
        throw std::invalid_argument(
            "migration.rollback.max_attempts must be greater than 0");
    }
    if (rollback.backoff_ms < 0) {
        throw std::invalid_argument(
            "migration.rollback.backoff_ms cannot be negative");
    }

    std::regex pattern;
    try {
        pattern.assign(attachment_pattern);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("migration.attachment_pattern is invalid: " +
                                    std::string(e.what()));
    }
    if (pattern.mark_count() < 1) {
        throw std::invalid_argument(
            "migration.attachment_pattern must capture the variable name");
    }
}

saga::RollbackPolicy MigrationConfig::rollback_policy() const {
    saga::RollbackPolicy policy;
    policy.max_attempts = rollback.max_attempts;
    policy.backoff = std::chrono::milliseconds(rollback.backoff_ms);
    return policy;
}

}  // namespace pgshift::migration
