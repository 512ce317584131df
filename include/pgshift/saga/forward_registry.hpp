#pragma once

#include <any>
#include <map>
#include <stdexcept>
#include <string>

#include "pgshift/saga/step_id.hpp"

namespace pgshift::saga {

/**
 * @brief Payloads published by completed steps, keyed by step identity.
 *
 * Append-only for the duration of a run. A consumer must be enqueued after
 * the producer; nothing here reorders steps to make that hold.
 */
class ForwardRegistry {
public:
    /// @brief Records the payload of a completed step.
    /// @throws std::logic_error if a payload for @p id already exists.
    void record(StepId id, std::any payload);

    bool contains(StepId id) const { return payloads_.count(id) > 0; }
    size_t size() const { return payloads_.size(); }

    /// @brief Returns the payload of @p id as @p T.
    /// @throws std::out_of_range if nothing was recorded for @p id.
    /// @throws std::logic_error if the payload is not a @p T.
    template <typename T>
    const T& get(StepId id) const {
        auto it = payloads_.find(id);
        if (it == payloads_.end()) {
            throw std::out_of_range("No forward payload recorded for step " +
                                    to_string(id));
        }
        const T* value = std::any_cast<T>(&it->second);
        if (value == nullptr) {
            throw std::logic_error("Forward payload of step " + to_string(id) +
                                   " has an unexpected type");
        }
        return *value;
    }

private:
    std::map<StepId, std::any> payloads_;
};

}  // namespace pgshift::saga
