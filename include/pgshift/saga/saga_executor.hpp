#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

#include "pgshift/saga/cancellation.hpp"
#include "pgshift/saga/compensation_stack.hpp"
#include "pgshift/saga/forward_registry.hpp"
#include "pgshift/saga/step.hpp"

namespace pgshift::saga {

enum class RunStatus {
    completed,  // the pending queue drained
    aborted     // a step raised AbortCleanly
};

struct RunReport {
    RunStatus status = RunStatus::completed;
    std::string abort_message;
    size_t steps_performed = 0;
    UnwindReport unwind;
};

/**
 * @brief Runs steps in FIFO order and unwinds the compensation stack when
 * the run ends, whatever the outcome.
 *
 * The pending queue, forward registry and compensation stack live only for
 * the duration of one engage() call. Faults propagate to the caller after
 * the unwind has completed; a clean abort is reported in the RunReport.
 */
class SagaExecutor {
public:
    explicit SagaExecutor(
        RollbackPolicy policy = {},
        CancellationToken& token = CancellationToken::global());

    // Steps must already be in dependency order
    RunReport engage(const std::vector<StepPtr>& steps);

private:
    struct Run {
        std::deque<StepPtr> pending;
        ForwardRegistry forward;
        CompensationStack compensations;
    };

    void drive(Run& run, RunReport& report);
    void unwind(Run& run, RunReport& report);

    RollbackPolicy policy_;
    CancellationToken& token_;
};

}  // namespace pgshift::saga
