// tests/migration/test_migration_steps.cpp
#define BOOST_TEST_MODULE MigrationStepTests

#include <boost/test/unit_test.hpp>

#include "../support/fakes.hpp"
#include "pgshift/migration/backup_discovery.hpp"
#include "pgshift/migration/check_source.hpp"
#include "pgshift/migration/data_transfer.hpp"
#include "pgshift/migration/maintenance.hpp"
#include "pgshift/migration/provision_database.hpp"
#include "pgshift/migration/rebind_config.hpp"
#include "pgshift/migration/scale_zero.hpp"

using namespace pgshift;
using namespace pgshift::migration;
using pgshift::testing::FakeControlPlane;
using pgshift::testing::FakeTransferService;

namespace {

struct StepFixture {
    std::shared_ptr<FakeControlPlane> api = std::make_shared<FakeControlPlane>();
    std::shared_ptr<FakeTransferService> transfers =
        std::make_shared<FakeTransferService>();
    saga::CancellationToken token;
    MigrationContext context = testing::make_context(api, transfers, token);
    saga::ForwardRegistry forward;

    // What ProvisionDatabase would have published
    void provisioned() {
        api->config["HEROKU_POSTGRESQL_RED"] = testing::kNewUrl;
        forward.record(saga::StepId::provision_database,
                       ProvisionResult{"HEROKU_POSTGRESQL_RED", api->config});
    }
};

}  // namespace

BOOST_FIXTURE_TEST_SUITE(MigrationStepTestSuite, StepFixture)

BOOST_AUTO_TEST_CASE(test_check_source_passes_when_bound) {
    auto step = std::make_shared<CheckSource>(context);
    auto outcome = step->perform(forward);
    BOOST_CHECK(outcome.more_rollbacks.empty());
    BOOST_CHECK(!outcome.forward.has_value());
    BOOST_CHECK_EQUAL(api->mutations(), 0);
}

BOOST_AUTO_TEST_CASE(test_check_source_aborts_without_binding) {
    api->config.erase("SHARED_DATABASE_URL");
    auto step = std::make_shared<CheckSource>(context);
    try {
        step->perform(forward);
        BOOST_FAIL("expected AbortCleanly");
    } catch (const saga::AbortCleanly& e) {
        BOOST_CHECK_EQUAL(std::string(e.what()),
                          "No SHARED_DATABASE_URL found: cannot migrate.");
    }
}

BOOST_AUTO_TEST_CASE(test_backup_discovery_tolerates_existing_addon) {
    auto step = std::make_shared<BackupDiscovery>(context);
    BOOST_CHECK_NO_THROW(step->perform(forward));
}

BOOST_AUTO_TEST_CASE(test_backup_discovery_installs_missing_addon) {
    api->addons.clear();
    api->config.erase("PGBACKUPS_URL");
    auto step = std::make_shared<BackupDiscovery>(context);
    step->perform(forward);
    BOOST_CHECK(api->addons.count("pgbackups:plus"));
    BOOST_CHECK(api->config.count("PGBACKUPS_URL"));
}

BOOST_AUTO_TEST_CASE(test_backup_discovery_reraises_other_errors) {
    api->fail("provision_addon");
    auto step = std::make_shared<BackupDiscovery>(context);
    BOOST_CHECK_THROW(step->perform(forward), api::ApiError);
}

BOOST_AUTO_TEST_CASE(test_provision_publishes_binding_and_snapshot) {
    auto step = std::make_shared<ProvisionDatabase>(context);
    auto outcome = step->perform(forward);

    BOOST_REQUIRE(outcome.forward.has_value());
    const auto& result = std::any_cast<const ProvisionResult&>(outcome.forward);
    BOOST_CHECK_EQUAL(result.binding_name, "HEROKU_POSTGRESQL_RED");
    BOOST_CHECK_EQUAL(result.config.at("HEROKU_POSTGRESQL_RED"),
                      testing::kNewUrl);
    BOOST_CHECK_EQUAL(result.config.at("SHARED_DATABASE_URL"),
                      testing::kSourceUrl);
    BOOST_CHECK(outcome.more_rollbacks.empty());
}

BOOST_AUTO_TEST_CASE(test_provision_rejects_unparsable_message) {
    api->attachment_message = "Something unexpected";
    auto step = std::make_shared<ProvisionDatabase>(context);
    BOOST_CHECK_THROW(step->perform(forward), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_provision_aborts_if_source_vanished) {
    // Source binding removed between the pre-flight check and provisioning
    api->config.erase("SHARED_DATABASE_URL");
    auto step = std::make_shared<ProvisionDatabase>(context);
    BOOST_CHECK_THROW(step->perform(forward), saga::AbortCleanly);
}

BOOST_AUTO_TEST_CASE(test_parse_attachment_name) {
    std::regex pattern(context.settings.attachment_pattern);
    BOOST_CHECK_EQUAL(
        *parse_attachment_name("Attached as HEROKU_POSTGRESQL_CYAN\n", pattern),
        "HEROKU_POSTGRESQL_CYAN");
    BOOST_CHECK(!parse_attachment_name("Attached as DATABASE_URL", pattern));
    BOOST_CHECK(!parse_attachment_name("", pattern));
}

BOOST_AUTO_TEST_CASE(test_maintenance_registers_itself_and_rolls_back) {
    auto step = std::make_shared<Maintenance>(context);
    auto outcome = step->perform(forward);

    BOOST_CHECK(api->maintenance);
    BOOST_REQUIRE_EQUAL(outcome.more_rollbacks.size(), 1);
    BOOST_CHECK(outcome.more_rollbacks[0] == step);

    step->rollback();
    BOOST_CHECK(!api->maintenance);
}

BOOST_AUTO_TEST_CASE(test_maintenance_failure_needs_compensation) {
    api->fail("set_maintenance");
    auto step = std::make_shared<Maintenance>(context);
    BOOST_CHECK_THROW(step->perform(forward), saga::NeedsCompensation);
}

BOOST_AUTO_TEST_CASE(test_maintenance_rollback_before_perform_is_noop) {
    auto step = std::make_shared<Maintenance>(context);
    BOOST_CHECK_NO_THROW(step->rollback());
    BOOST_CHECK(api->calls.empty());
}

BOOST_AUTO_TEST_CASE(test_scale_zero_and_restore) {
    auto step = std::make_shared<ScaleZero>(context);
    auto outcome = step->perform(forward);

    BOOST_CHECK_EQUAL(api->processes.at("web"), 0);
    BOOST_CHECK_EQUAL(api->processes.at("worker"), 0);
    BOOST_REQUIRE_EQUAL(outcome.more_rollbacks.size(), 1);

    step->rollback();
    BOOST_CHECK_EQUAL(api->processes.at("web"), 2);
    BOOST_CHECK_EQUAL(api->processes.at("worker"), 1);
}

BOOST_AUTO_TEST_CASE(test_scale_zero_rollback_before_perform_is_noop) {
    auto step = std::make_shared<ScaleZero>(context);
    BOOST_CHECK(!step->previous_counts());
    BOOST_CHECK_NO_THROW(step->rollback());
    BOOST_CHECK(api->calls.empty());
}

BOOST_AUTO_TEST_CASE(test_scale_zero_read_failure_leaves_nothing_to_undo) {
    api->fail("get_process_counts");
    auto step = std::make_shared<ScaleZero>(context);
    BOOST_CHECK_THROW(step->perform(forward), api::ApiError);
    BOOST_CHECK(!step->previous_counts());

    step->rollback();
    BOOST_CHECK_EQUAL(api->mutations(), 0);
}

BOOST_AUTO_TEST_CASE(test_scale_zero_partial_failure_needs_compensation) {
    api->fail_scaling("worker");
    auto step = std::make_shared<ScaleZero>(context);
    BOOST_CHECK_THROW(step->perform(forward), saga::NeedsCompensation);
    BOOST_CHECK_EQUAL(api->processes.at("web"), 0);

    api->fail_scaling("");
    step->rollback();
    BOOST_CHECK_EQUAL(api->processes.at("web"), 2);
    BOOST_CHECK_EQUAL(api->processes.at("worker"), 1);
}

BOOST_AUTO_TEST_CASE(test_scale_zero_without_processes) {
    api->processes.clear();
    auto step = std::make_shared<ScaleZero>(context);
    auto outcome = step->perform(forward);
    BOOST_CHECK_EQUAL(outcome.more_rollbacks.size(), 1);
    BOOST_CHECK_EQUAL(api->mutations(), 0);
}

BOOST_AUTO_TEST_CASE(test_rebind_moves_every_matching_variable) {
    provisioned();
    auto step = std::make_shared<RebindConfig>(context);
    auto outcome = step->perform(forward);

    BOOST_CHECK(outcome.more_rollbacks.empty());
    BOOST_CHECK_EQUAL(api->config.at("SHARED_DATABASE_URL"), testing::kNewUrl);
    BOOST_CHECK_EQUAL(api->config.at("DATABASE_URL"), testing::kNewUrl);
    BOOST_CHECK_EQUAL(api->config.at("OTHER_VAR"), "unrelated");

    step->rollback();
    BOOST_CHECK_EQUAL(api->config.at("SHARED_DATABASE_URL"),
                      testing::kSourceUrl);
    BOOST_CHECK_EQUAL(api->config.at("DATABASE_URL"), testing::kSourceUrl);
    BOOST_CHECK_EQUAL(api->config.at("HEROKU_POSTGRESQL_RED"),
                      testing::kNewUrl);
}

BOOST_AUTO_TEST_CASE(test_rebind_failure_needs_compensation) {
    provisioned();
    api->fail("put_config_vars");
    auto step = std::make_shared<RebindConfig>(context);
    BOOST_CHECK_THROW(step->perform(forward), saga::NeedsCompensation);
}

BOOST_AUTO_TEST_CASE(test_rebind_rollback_before_perform_is_noop) {
    auto step = std::make_shared<RebindConfig>(context);
    BOOST_CHECK_NO_THROW(step->rollback());
    BOOST_CHECK(api->calls.empty());
}

BOOST_AUTO_TEST_CASE(test_rebind_helpers) {
    api::ConfigVars vars{{"A", "x"}, {"B", "y"}, {"C", "x"}};
    auto names = find_rebindings(vars, "x");
    BOOST_REQUIRE_EQUAL(names.size(), 2);
    BOOST_CHECK_EQUAL(humanize(names), "A, C");
    BOOST_CHECK_EQUAL(bind_all(names, "z").at("C"), "z");
    BOOST_CHECK_EQUAL(humanize({}), "");
}

BOOST_AUTO_TEST_CASE(test_data_transfer_copies_source_into_new_database) {
    provisioned();
    transfers->states = {FakeTransferService::pending("copying"),
                         FakeTransferService::finished()};
    auto step = std::make_shared<DataTransfer>(context);
    auto outcome = step->perform(forward);

    BOOST_CHECK(outcome.more_rollbacks.empty());
    BOOST_REQUIRE_EQUAL(transfers->endpoints.size(), 1);
    BOOST_CHECK_EQUAL(transfers->endpoints[0], testing::kBackupsUrl);
    BOOST_CHECK_EQUAL(transfers->from_url, testing::kSourceUrl);
    BOOST_CHECK_EQUAL(transfers->from_name, "SHARED_DATABASE_URL");
    BOOST_CHECK_EQUAL(transfers->to_url, testing::kNewUrl);
    BOOST_CHECK_EQUAL(transfers->to_name, "HEROKU_POSTGRESQL_RED");
    BOOST_CHECK_EQUAL(transfers->gets, 2);
}

BOOST_AUTO_TEST_CASE(test_data_transfer_error_aborts_cleanly) {
    provisioned();
    transfers->states = {FakeTransferService::errored(
        "psql: FATAL: password authentication failed")};
    auto step = std::make_shared<DataTransfer>(context);
    try {
        step->perform(forward);
        BOOST_FAIL("expected AbortCleanly");
    } catch (const saga::AbortCleanly& e) {
        BOOST_CHECK(std::string(e.what()).find(
                        "The database credentials are incorrect.") !=
                    std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(test_data_transfer_without_endpoint_aborts) {
    api->config.erase("PGBACKUPS_URL");
    provisioned();
    auto step = std::make_shared<DataTransfer>(context);
    BOOST_CHECK_THROW(step->perform(forward), saga::AbortCleanly);
    BOOST_CHECK(transfers->endpoints.empty());
}

BOOST_AUTO_TEST_SUITE_END()
