// tests/api/test_api_parsing.cpp
#define BOOST_TEST_MODULE ApiParsingTests

#include <boost/test/unit_test.hpp>
#include <cstdlib>
#include <nlohmann/json.hpp>

#include "pgshift/api/api_config.hpp"
#include "pgshift/api/heroku_control_plane.hpp"
#include "pgshift/api/pgbackups_client.hpp"
#include "pgshift/http/http_client.hpp"

using namespace pgshift;
using nlohmann::json;

BOOST_AUTO_TEST_SUITE(ControlPlaneParsingTestSuite)

BOOST_AUTO_TEST_CASE(test_count_processes_groups_by_type) {
    auto listing = json::parse(R"([
        {"process": "web.1", "state": "up"},
        {"process": "web.2", "state": "up"},
        {"process": "worker.1", "state": "crashed"},
        {"state": "up"}
    ])");

    auto counts = api::count_processes(listing);
    BOOST_CHECK_EQUAL(counts.size(), 2);
    BOOST_CHECK_EQUAL(counts.at("web"), 2);
    BOOST_CHECK_EQUAL(counts.at("worker"), 1);

    BOOST_CHECK(api::count_processes(json::array()).empty());
    BOOST_CHECK_THROW(api::count_processes(json::object()), api::ApiError);
}

BOOST_AUTO_TEST_CASE(test_config_vars_from_json) {
    auto vars = api::config_vars_from_json(json::parse(
        R"({"DATABASE_URL": "postgres://a", "WEB_CONCURRENCY": 3,
            "UNSET": null})"));

    BOOST_CHECK_EQUAL(vars.at("DATABASE_URL"), "postgres://a");
    BOOST_CHECK_EQUAL(vars.at("WEB_CONCURRENCY"), "3");
    BOOST_CHECK(vars.count("UNSET") == 0);
    BOOST_CHECK_THROW(api::config_vars_from_json(json::array()),
                      api::ApiError);
}

BOOST_AUTO_TEST_CASE(test_transfer_from_json) {
    auto running = api::transfer_from_json(json::parse(
        R"({"id": 17, "log": "dumping", "error_at": null,
            "finished_at": null})"));
    BOOST_CHECK_EQUAL(running.id, "17");
    BOOST_CHECK_EQUAL(running.log, "dumping");
    BOOST_CHECK(!running.terminal());

    auto failed = api::transfer_from_json(json::parse(
        R"({"id": "17", "error_at": "2012-05-01 10:00:00"})"));
    BOOST_CHECK(failed.failed());
    BOOST_CHECK(failed.terminal());

    auto finished = api::transfer_from_json(json::parse(
        R"({"id": "17", "finished_at": "2012-05-01 10:00:00"})"));
    BOOST_CHECK(!finished.failed());
    BOOST_CHECK(finished.terminal());

    BOOST_CHECK_THROW(api::transfer_from_json(json::parse(R"({"log": ""})")),
                      api::ApiError);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(HttpClientTestSuite)

BOOST_AUTO_TEST_CASE(test_base_url_parsing) {
    http::HttpClient plain("http://localhost:5000/", std::chrono::seconds(5));
    BOOST_CHECK_EQUAL(plain.host(), "localhost");
    BOOST_CHECK_EQUAL(plain.port(), "5000");
    BOOST_CHECK(!plain.secure());

    http::HttpClient tls("https://u:p@pgbackups.example.com/client",
                         std::chrono::seconds(5));
    BOOST_CHECK_EQUAL(tls.host(), "pgbackups.example.com");
    BOOST_CHECK_EQUAL(tls.port(), "443");
    BOOST_CHECK(tls.secure());
    BOOST_CHECK_EQUAL(tls.make_target("/transfers/3"), "/client/transfers/3");
}

BOOST_AUTO_TEST_CASE(test_invalid_base_url) {
    BOOST_CHECK_THROW(http::HttpClient("not a url", std::chrono::seconds(1)),
                      std::invalid_argument);
    BOOST_CHECK_THROW(
        http::HttpClient("ftp://example.com", std::chrono::seconds(1)),
        std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_make_target_with_query) {
    http::HttpClient client("https://api.heroku.com", std::chrono::seconds(5));
    BOOST_CHECK_EQUAL(
        client.make_target("/apps/demo/ps/scale", {{"type", "web"}, {"qty", "0"}}),
        "/apps/demo/ps/scale?type=web&qty=0");
    BOOST_CHECK_EQUAL(
        client.make_target("/apps/demo/server/maintenance",
                           {{"maintenance_mode", "1"}}),
        "/apps/demo/server/maintenance?maintenance_mode=1");
}

BOOST_AUTO_TEST_CASE(test_base64_encode) {
    BOOST_CHECK_EQUAL(http::base64_encode(""), "");
    BOOST_CHECK_EQUAL(http::base64_encode(":secret"), "OnNlY3JldA==");
    BOOST_CHECK_EQUAL(http::base64_encode("user:pass"), "dXNlcjpwYXNz");
}

BOOST_AUTO_TEST_CASE(test_error_message) {
    BOOST_CHECK_EQUAL(
        http::error_message({422, R"({"error": "Add-on already installed."})"}),
        "Add-on already installed.");
    BOOST_CHECK_EQUAL(
        http::error_message({404, R"({"id": "not_found", "message": "App not found"})"}),
        "App not found");
    BOOST_CHECK_EQUAL(http::error_message({503, ""}), "HTTP 503");
    BOOST_CHECK_EQUAL(http::error_message({500, "oops"}), "HTTP 500: oops");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ApiConfigTestSuite)

BOOST_AUTO_TEST_CASE(test_defaults_and_environment) {
    api::ApiConfig config;
    BOOST_CHECK_EQUAL(config.base_url, "https://api.heroku.com");
    BOOST_CHECK_EQUAL(config.timeout_seconds, 30);
    BOOST_CHECK_NO_THROW(config.validate());

    ::setenv("HEROKU_API_KEY", "from-env", 1);
    config.api_key = "from-file";
    config.apply_environment();
    BOOST_CHECK_EQUAL(config.api_key, "from-env");
    ::unsetenv("HEROKU_API_KEY");

    config.timeout_seconds = 0;
    BOOST_CHECK_THROW(config.validate(), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
