#pragma once

#include <functional>
#include <memory>
#include <string>

#include "pgshift/api/types.hpp"

namespace pgshift::api {

/// @brief Operations the migration needs from the hosting control plane.
/// Every call is synchronous; failures are reported by throwing (ApiError
/// for remote refusals).
class IControlPlane {
public:
    virtual ~IControlPlane() = default;

    virtual void set_maintenance(const std::string &app, bool enabled) = 0;

    virtual ProcessCounts get_process_counts(const std::string &app) = 0;
    virtual void set_process_count(const std::string &app,
                                   const std::string &type, int count) = 0;

    /// @throws AddonConflictError if the add-on is already installed.
    virtual AddonResult provision_addon(const std::string &app,
                                        const std::string &addon) = 0;

    virtual ConfigVars get_config_vars(const std::string &app) = 0;
    virtual void put_config_vars(const std::string &app,
                                 const ConfigVars &vars) = 0;
};

/// @brief Database-to-database copy service.
class ITransferService {
public:
    virtual ~ITransferService() = default;

    virtual Transfer create_transfer(const std::string &from_url,
                                     const std::string &from_name,
                                     const std::string &to_url,
                                     const std::string &to_name) = 0;
    virtual Transfer get_transfer(const std::string &id) = 0;
};

// Builds a transfer client for an endpoint discovered at run time
using TransferServiceFactory =
    std::function<std::unique_ptr<ITransferService>(const std::string &)>;

}  // namespace pgshift::api
