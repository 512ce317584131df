#include "pgshift/saga/saga_executor.hpp"

#include "pgshift/log/logger.hpp"

namespace pgshift::saga {

SagaExecutor::SagaExecutor(RollbackPolicy policy, CancellationToken& token)
    : policy_(policy), token_(token) {}

RunReport SagaExecutor::engage(const std::vector<StepPtr>& steps) {
    Run run;
    RunReport report;
    run.pending.assign(steps.begin(), steps.end());

    try {
        drive(run, report);
    } catch (const std::exception& e) {
        PGSHIFT_LOG_DEBUG << "Run failed, unwinding: " << e.what();
        unwind(run, report);
        throw;
    } catch (...) {
        PGSHIFT_LOG_DEBUG << "Run failed with a non-standard exception, "
                             "unwinding";
        unwind(run, report);
        throw;
    }

    unwind(run, report);
    return report;
}

void SagaExecutor::drive(Run& run, RunReport& report) {
    while (!run.pending.empty()) {
        token_.throw_if_requested();

        StepPtr step = std::move(run.pending.front());
        run.pending.pop_front();

        PGSHIFT_LOG_DEBUG << "Performing step " << step->name();

        StepOutcome outcome;
        try {
            outcome = step->perform(run.forward);
        } catch (const NeedsCompensation&) {
            run.compensations.push(step);
            throw;
        } catch (const AbortCleanly& e) {
            PGSHIFT_LOG_WARN << e.what();
            report.status = RunStatus::aborted;
            report.abort_message = e.what();
            return;
        }

        ++report.steps_performed;

        for (auto& next : outcome.more_steps) {
            run.pending.push_back(std::move(next));
        }
        for (auto& compensation : outcome.more_rollbacks) {
            run.compensations.push(std::move(compensation));
        }
        if (outcome.forward.has_value()) {
            run.forward.record(step->id(), std::move(outcome.forward));
        }
    }
}

void SagaExecutor::unwind(Run& run, RunReport& report) {
    // From here on interrupts are ignored
    token_.begin_unwind();

    if (run.compensations.empty()) {
        return;
    }

    PGSHIFT_LOG_DEBUG << "Unwinding " << run.compensations.size()
                      << " compensation(s)";
    report.unwind = run.compensations.unwind(policy_);
}

}  // namespace pgshift::saga
