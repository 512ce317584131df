#pragma once

#include <any>
#include <memory>
#include <string>
#include <vector>

#include "pgshift/saga/errors.hpp"
#include "pgshift/saga/forward_registry.hpp"
#include "pgshift/saga/step_id.hpp"

namespace pgshift::saga {

class Step;
using StepPtr = std::shared_ptr<Step>;

/// @brief What a successful Step::perform hands back to the executor.
struct StepOutcome {
    std::vector<StepPtr> more_steps;      // appended to the pending queue
    std::vector<StepPtr> more_rollbacks;  // pushed onto the compensation stack
    std::any forward;                     // recorded under the step's id if set
};

/**
 * @brief A single unit of migration work.
 *
 * perform() either returns a StepOutcome or throws: NeedsCompensation,
 * AbortCleanly, or anything else (a fault). rollback() is only called when
 * has_rollback() is true and must be a no-op when perform() never got far
 * enough to capture rollback state.
 */
class Step : public std::enable_shared_from_this<Step> {
public:
    explicit Step(StepId id) : id_(id) {}
    virtual ~Step() = default;

    StepId id() const { return id_; }
    virtual std::string name() const { return to_string(id_); }

    virtual StepOutcome perform(const ForwardRegistry& forward) = 0;

    virtual bool has_rollback() const { return false; }
    virtual void rollback() {}

protected:
    // Outcome registering this step for compensation
    StepOutcome compensate_self() {
        StepOutcome outcome;
        outcome.more_rollbacks.push_back(shared_from_this());
        return outcome;
    }

private:
    StepId id_;
};

}  // namespace pgshift::saga
