// tests/saga/test_forward_registry.cpp
#define BOOST_TEST_MODULE ForwardRegistryTests

#include "pgshift/saga/forward_registry.hpp"

#include <boost/test/unit_test.hpp>
#include <map>

using namespace pgshift::saga;

BOOST_AUTO_TEST_SUITE(ForwardRegistryTestSuite)

BOOST_AUTO_TEST_CASE(test_recorded_payload_is_returned_unmodified) {
    ForwardRegistry registry;
    std::map<std::string, std::string> snapshot{{"DATABASE_URL", "postgres://a"}};
    registry.record(StepId::provision_database, snapshot);

    BOOST_CHECK(registry.contains(StepId::provision_database));
    BOOST_CHECK(!registry.contains(StepId::scale_zero));
    const auto& stored =
        registry.get<std::map<std::string, std::string>>(
            StepId::provision_database);
    BOOST_CHECK(stored == snapshot);
}

BOOST_AUTO_TEST_CASE(test_registry_is_append_only) {
    ForwardRegistry registry;
    registry.record(StepId::provision_database, 1);
    BOOST_CHECK_THROW(registry.record(StepId::provision_database, 2),
                      std::logic_error);
    BOOST_CHECK_EQUAL(registry.get<int>(StepId::provision_database), 1);
    BOOST_CHECK_EQUAL(registry.size(), 1);
}

BOOST_AUTO_TEST_CASE(test_missing_and_mistyped_payloads_throw) {
    ForwardRegistry registry;
    BOOST_CHECK_THROW(registry.get<int>(StepId::check_source),
                      std::out_of_range);

    registry.record(StepId::check_source, std::string("text"));
    BOOST_CHECK_THROW(registry.get<int>(StepId::check_source),
                      std::logic_error);
}

BOOST_AUTO_TEST_SUITE_END()
