#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "pgshift/saga/step.hpp"

namespace pgshift::saga {

// How hard to try each rollback before giving up on it
struct RollbackPolicy {
    int max_attempts = 1;
    std::chrono::milliseconds backoff{0};  // doubled after every failed attempt
};

struct UnwindReport {
    size_t succeeded = 0;
    size_t failed = 0;
    std::vector<StepId> rolled_back;  // in the order rollbacks were run
    std::vector<std::string> errors;  // last error of every failed rollback
};

/// @brief LIFO set of steps whose effects must be undone.
class CompensationStack {
public:
    // Duplicate pushes are kept; each entry is rolled back on its own.
    void push(StepPtr step);

    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }
    const std::vector<StepPtr>& entries() const { return entries_; }

    /// @brief Pops every entry and runs its rollback, most recent first.
    /// A failing rollback is logged and recorded but never stops the drain.
    UnwindReport unwind(const RollbackPolicy& policy);

private:
    bool run_rollback(Step& step, const RollbackPolicy& policy,
                      std::string& last_error);

    std::vector<StepPtr> entries_;
};

}  // namespace pgshift::saga
