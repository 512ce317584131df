#include "pgshift/saga/compensation_stack.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include "pgshift/log/logger.hpp"

namespace pgshift::saga {

void CompensationStack::push(StepPtr step) {
    if (!step) {
        throw std::invalid_argument("Cannot push an empty step for rollback");
    }
    PGSHIFT_LOG_DEBUG << "Registered rollback for step " << step->name();
    entries_.push_back(std::move(step));
}

UnwindReport CompensationStack::unwind(const RollbackPolicy& policy) {
    UnwindReport report;

    while (!entries_.empty()) {
        StepPtr step = std::move(entries_.back());
        entries_.pop_back();

        // Steps without a sensible rollback are simply dropped
        if (!step->has_rollback()) {
            continue;
        }

        std::string last_error;
        report.rolled_back.push_back(step->id());
        if (run_rollback(*step, policy, last_error)) {
            ++report.succeeded;
        } else {
            ++report.failed;
            report.errors.push_back(step->name() + ": " + last_error);
            PGSHIFT_LOG_ERROR << "Rollback of " << step->name()
                              << " did not succeed, manual inspection "
                                 "required: "
                              << last_error;
        }
    }

    return report;
}

bool CompensationStack::run_rollback(Step& step, const RollbackPolicy& policy,
                                     std::string& last_error) {
    const int attempts = std::max(1, policy.max_attempts);
    auto backoff = policy.backoff;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            step.rollback();
            return true;
        } catch (const std::exception& e) {
            last_error = e.what();
            PGSHIFT_LOG_ERROR << "Rollback of " << step.name() << " failed ("
                              << attempt << "/" << attempts
                              << "): " << last_error;
        } catch (...) {
            last_error = "unknown error";
            PGSHIFT_LOG_ERROR << "Rollback of " << step.name() << " failed ("
                              << attempt << "/" << attempts
                              << ") with a non-standard exception";
        }

        if (attempt < attempts && backoff.count() > 0) {
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
        }
    }

    return false;
}

}  // namespace pgshift::saga
