#pragma once

#include <atomic>

namespace pgshift::saga {

/**
 * @brief Operator interrupt state shared between a signal handler and the
 * executor.
 *
 * Once begin_unwind() has been called, further requests are ignored so the
 * compensation stack always drains completely. The unwinding flag is never
 * cleared.
 */
class CancellationToken {
public:
    // Process-wide token driven by install_signal_handlers()
    static CancellationToken& global();

    void request() noexcept {
        if (!unwinding_.load()) {
            requested_.store(true);
        }
    }
    bool requested() const noexcept { return requested_.load(); }

    // Throws Cancelled if an interrupt is pending
    void throw_if_requested() const;

    void begin_unwind() noexcept { unwinding_.store(true); }
    bool unwinding() const noexcept { return unwinding_.load(); }

private:
    std::atomic<bool> requested_{false};
    std::atomic<bool> unwinding_{false};
};

// Routes SIGINT and SIGTERM to CancellationToken::global()
void install_signal_handlers();

}  // namespace pgshift::saga
