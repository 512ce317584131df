#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>

#include "pgshift/api/control_plane.hpp"
#include "pgshift/saga/cancellation.hpp"

namespace pgshift::transfer {

/**
 * @brief Blocks until a transfer reaches a terminal state.
 *
 * Polls the service at a fixed interval. The cancellation token is checked
 * between polls, so an operator interrupt surfaces as saga::Cancelled.
 */
class TransferPoller {
public:
    TransferPoller(api::ITransferService& service,
                   std::chrono::milliseconds interval,
                   saga::CancellationToken& token);

    api::Transfer wait(api::Transfer transfer);

    size_t polls() const { return polls_; }

private:
    void pause();

    api::ITransferService& service_;
    std::chrono::milliseconds interval_;
    saga::CancellationToken& token_;
    size_t polls_ = 0;
};

// Operator message for a transfer that reported an error
std::string describe_failure(const api::Transfer& transfer);

// Resolves a database reference (config var name or add-on color such as
// "RED") to its variable name and URL.
std::optional<std::pair<std::string, std::string>> resolve_database(
    const api::ConfigVars& vars, const std::string& reference);

}  // namespace pgshift::transfer
