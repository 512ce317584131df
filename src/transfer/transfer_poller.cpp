#include "pgshift/transfer/transfer_poller.hpp"

#include <algorithm>
#include <cctype>
#include <thread>

#include "pgshift/log/logger.hpp"

namespace pgshift::transfer {

namespace {

constexpr std::chrono::milliseconds kSleepSlice{100};

std::string last_line(const std::string& text) {
    auto end = text.find_last_not_of("\r\n");
    if (end == std::string::npos) {
        return "";
    }
    auto begin = text.rfind('\n', end);
    begin = begin == std::string::npos ? 0 : begin + 1;
    return text.substr(begin, end - begin + 1);
}

}  // namespace

TransferPoller::TransferPoller(api::ITransferService& service,
                               std::chrono::milliseconds interval,
                               saga::CancellationToken& token)
    : service_(service), interval_(interval), token_(token) {}

api::Transfer TransferPoller::wait(api::Transfer transfer) {
    std::string reported;

    while (!transfer.terminal()) {
        pause();
        token_.throw_if_requested();

        transfer = service_.get_transfer(transfer.id);
        ++polls_;

        auto progress = last_line(transfer.log);
        if (!progress.empty() && progress != reported) {
            PGSHIFT_LOG_INFO << "  " << progress;
            reported = std::move(progress);
        }
    }

    PGSHIFT_LOG_DEBUG << "Transfer " << transfer.id << " finished after "
                      << polls_ << " poll(s)"
                      << (transfer.failed() ? " with an error" : "");
    return transfer;
}

void TransferPoller::pause() {
    auto remaining = interval_;
    while (remaining.count() > 0) {
        token_.throw_if_requested();
        auto slice = std::min(remaining, kSleepSlice);
        std::this_thread::sleep_for(slice);
        remaining -= slice;
    }
}

std::string describe_failure(const api::Transfer& transfer) {
    std::string message = "An error occurred and your backup did not finish.";
    if (transfer.log.find("Name or service not known") != std::string::npos) {
        message += "\nThe database is not yet online. Please try again.";
    }
    if (transfer.log.find("psql: FATAL:") != std::string::npos) {
        message += "\nThe database credentials are incorrect.";
    }
    return message;
}

std::optional<std::pair<std::string, std::string>> resolve_database(
    const api::ConfigVars& vars, const std::string& reference) {
    std::string upper = reference;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    for (const auto& candidate :
         {reference, upper, upper + "_URL", "HEROKU_POSTGRESQL_" + upper,
          "HEROKU_POSTGRESQL_" + upper + "_URL"}) {
        auto it = vars.find(candidate);
        if (it != vars.end()) {
            return std::make_pair(it->first, it->second);
        }
    }
    return std::nullopt;
}

}  // namespace pgshift::transfer
