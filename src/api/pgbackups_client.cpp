#include "pgshift/api/pgbackups_client.hpp"

#include <cstdint>

namespace pgshift::api {

namespace {

std::optional<std::string> optional_timestamp(const nlohmann::json& object,
                                              const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->is_string() ? it->get<std::string>() : it->dump();
}

}  // namespace

PgBackupsClient::PgBackupsClient(const std::string& endpoint,
                                 std::chrono::seconds timeout,
                                 std::string user_agent)
    : client_(endpoint, timeout, std::move(user_agent)) {}

Transfer PgBackupsClient::create_transfer(const std::string& from_url,
                                          const std::string& from_name,
                                          const std::string& to_url,
                                          const std::string& to_name) {
    nlohmann::json body;
    body["from_url"] = from_url;
    body["from_name"] = from_name;
    body["to_url"] = to_url;
    body["to_name"] = to_name;
    return transfer_from_json(
        client_.send_json(http::verb::post, "/transfers", {}, &body));
}

Transfer PgBackupsClient::get_transfer(const std::string& id) {
    return transfer_from_json(
        client_.send_json(http::verb::get, "/transfers/" + id));
}

Transfer transfer_from_json(const nlohmann::json& object) {
    if (!object.is_object()) {
        throw ApiError(200, "Unexpected transfer format", object.dump());
    }

    Transfer transfer;
    auto id = object.find("id");
    if (id == object.end() || id->is_null()) {
        throw ApiError(200, "Transfer response has no id", object.dump());
    }
    transfer.id = id->is_string() ? id->get<std::string>()
                                  : std::to_string(id->get<int64_t>());

    auto log = object.find("log");
    if (log != object.end() && log->is_string()) {
        transfer.log = log->get<std::string>();
    }
    transfer.error_at = optional_timestamp(object, "error_at");
    transfer.finished_at = optional_timestamp(object, "finished_at");
    return transfer;
}

TransferServiceFactory make_pgbackups_factory(const ApiConfig& config) {
    const auto timeout = std::chrono::seconds(config.timeout_seconds);
    const auto user_agent = config.user_agent;
    return [timeout, user_agent](const std::string& endpoint) {
        return std::unique_ptr<ITransferService>(
            std::make_unique<PgBackupsClient>(endpoint, timeout, user_agent));
    };
}

}  // namespace pgshift::api
