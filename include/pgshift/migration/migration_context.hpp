#pragma once

#include <memory>
#include <string>

#include "pgshift/api/control_plane.hpp"
#include "pgshift/migration/migration_config.hpp"
#include "pgshift/saga/cancellation.hpp"

namespace pgshift::migration {

// Everything a migration step needs to reach the outside world
struct MigrationContext {
    std::shared_ptr<api::IControlPlane> api;
    std::string app;
    MigrationConfig settings;
    api::TransferServiceFactory transfer_service;
    saga::CancellationToken* token = &saga::CancellationToken::global();
};

// Published by ProvisionDatabase, consumed by DataTransfer and RebindConfig
struct ProvisionResult {
    std::string binding_name;  // e.g. HEROKU_POSTGRESQL_RED
    api::ConfigVars config;    // snapshot taken right after provisioning
};

}  // namespace pgshift::migration
