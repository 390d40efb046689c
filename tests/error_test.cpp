#include <string>
#include <system_error>

#include <gtest/gtest.h>

#include "error.hpp"

using namespace std;
using namespace sbql;

TEST( ErrorTest, ArgumentErrorsMapToInvalidArgument )
{
    for ( auto e : { sbql_errc::null_service_object, sbql_errc::null_binding_policy, sbql_errc::null_behavior_list,
                     sbql_errc::null_behavior, sbql_errc::null_activation_context, sbql_errc::empty_connection_string,
                     sbql_errc::empty_queue_name, sbql_errc::invalid_shared_access_key, sbql_errc::already_open } ) {
        error_code ec = e;
        EXPECT_EQ( ec, sbql_condition::invalid_argument ) << ec.message();
        EXPECT_NE( ec, sbql_condition::configuration_error ) << ec.message();
    }
}

TEST( ErrorTest, ConfigurationErrorsMapToConfigurationError )
{
    for ( auto e : { sbql_errc::no_endpoint, sbql_errc::ambiguous_endpoint, sbql_errc::malformed_connection_string,
                     sbql_errc::missing_setting, sbql_errc::decrypt_failed } ) {
        error_code ec = e;
        EXPECT_EQ( ec, sbql_condition::configuration_error ) << ec.message();
        EXPECT_NE( ec, sbql_condition::invalid_argument ) << ec.message();
    }
}

TEST( ErrorTest, CategoryNamesAndMessages )
{
    error_code ec = sbql_errc::empty_connection_string;
    EXPECT_STREQ( ec.category().name(), "sbql::sbql_category" );
    EXPECT_EQ( ec.message(), "connection string must not be null or empty" );

    error_condition condition = sbql_condition::configuration_error;
    EXPECT_STREQ( condition.category().name(), "sbql::sbql_condition_category" );
    EXPECT_EQ( condition.message(), "configuration error" );
}

TEST( ErrorTest, ResultCarriesErrorCode )
{
    Result< int > failed = make_error_code( sbql_errc::missing_setting );
    ASSERT_FALSE( failed );
    EXPECT_EQ( failed.error(), sbql_errc::missing_setting );

    Result< int > succeeded = 42;
    ASSERT_TRUE( succeeded );
    EXPECT_EQ( succeeded.value(), 42 );
}
