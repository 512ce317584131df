#include "pgshift/saga/cancellation.hpp"

#include <csignal>

#include "pgshift/saga/errors.hpp"

namespace pgshift::saga {

namespace {

extern "C" void handle_interrupt(int) {
    CancellationToken::global().request();
}

}  // namespace

CancellationToken& CancellationToken::global() {
    static CancellationToken token;
    return token;
}

void CancellationToken::throw_if_requested() const {
    if (requested()) {
        throw Cancelled();
    }
}

void install_signal_handlers() {
    // The handler must never run the static initializer
    CancellationToken::global();
    std::signal(SIGINT, handle_interrupt);
    std::signal(SIGTERM, handle_interrupt);
}

}  // namespace pgshift::saga
