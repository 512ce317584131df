#include "pgshift/saga/forward_registry.hpp"

namespace pgshift::saga {

void ForwardRegistry::record(StepId id, std::any payload) {
    auto [it, inserted] = payloads_.emplace(id, std::move(payload));
    if (!inserted) {
        throw std::logic_error("Forward payload already recorded for step " +
                               to_string(id));
    }
}

}  // namespace pgshift::saga
