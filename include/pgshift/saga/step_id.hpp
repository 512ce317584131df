#pragma once

#include <ostream>
#include <string>

namespace pgshift::saga {

/**
 * @brief Identity of a step kind.
 *
 * Used as the key of the forward registry: a step publishing a payload is
 * found again by later steps through this identifier.
 */
enum class StepId {
    check_source,
    backup_discovery,
    provision_database,
    maintenance,
    scale_zero,
    data_transfer,
    rebind_config
};

inline std::string to_string(StepId id) {
    switch (id) {
        case StepId::check_source:
            return "check_source";
        case StepId::backup_discovery:
            return "backup_discovery";
        case StepId::provision_database:
            return "provision_database";
        case StepId::maintenance:
            return "maintenance";
        case StepId::scale_zero:
            return "scale_zero";
        case StepId::data_transfer:
            return "data_transfer";
        case StepId::rebind_config:
            return "rebind_config";
        default:
            return "unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, StepId id) {
    return os << to_string(id);
}

}  // namespace pgshift::saga
