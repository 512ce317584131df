#pragma once

#include <stdexcept>
#include <string>

namespace pgshift::saga {

// Failure kinds a step can report on purpose. Any other exception thrown
// from Step::perform is a fault.
enum class FailureKind {
    needs_compensation,  // partial side effect, the failing step must be undone
    abort_cleanly        // stop the run without reporting an error
};

class StepFailure : public std::runtime_error {
public:
    StepFailure(FailureKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    FailureKind kind() const noexcept { return kind_; }

private:
    FailureKind kind_;
};

/// @brief The step had an observable side effect before failing; the
/// executor pushes it onto the compensation stack before propagating.
class NeedsCompensation : public StepFailure {
public:
    explicit NeedsCompensation(const std::string& message)
        : StepFailure(FailureKind::needs_compensation, message) {}
};

/// @brief A precondition does not hold or the remote side definitively
/// refused; the run stops, unwinds and reports the message to the operator.
class AbortCleanly : public StepFailure {
public:
    explicit AbortCleanly(const std::string& message)
        : StepFailure(FailureKind::abort_cleanly, message) {}
};

// Raised when the operator interrupted the run outside of unwind
class Cancelled : public std::runtime_error {
public:
    Cancelled() : std::runtime_error("Interrupted by operator") {}
};

}  // namespace pgshift::saga
