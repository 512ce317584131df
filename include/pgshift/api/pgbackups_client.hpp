#pragma once

#include <chrono>
#include <string>

#include "nlohmann/json.hpp"
#include "pgshift/api/api_config.hpp"
#include "pgshift/api/control_plane.hpp"
#include "pgshift/http/http_client.hpp"

namespace pgshift::api {

/// @brief ITransferService over the pgbackups transfer API. The endpoint
/// URL carries its own credentials as userinfo.
class PgBackupsClient : public ITransferService {
public:
    PgBackupsClient(const std::string& endpoint, std::chrono::seconds timeout,
                    std::string user_agent = "pgshift");

    Transfer create_transfer(const std::string& from_url,
                             const std::string& from_name,
                             const std::string& to_url,
                             const std::string& to_name) override;
    Transfer get_transfer(const std::string& id) override;

private:
    http::HttpClient client_;
};

Transfer transfer_from_json(const nlohmann::json& object);

TransferServiceFactory make_pgbackups_factory(const ApiConfig& config);

}  // namespace pgshift::api
