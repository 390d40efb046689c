#include "error.hpp"

using namespace std;

namespace sbql {

/**
 * function sbql_category, sbql_condition_category
 */

namespace detail {

string sbql_category::message( int value ) const
{
    switch ( static_cast< sbql_errc >( value ) ) {
        case sbql_errc::null_service_object: return "service object must not be null";
        case sbql_errc::null_binding_policy: return "binding policy must not be null";
        case sbql_errc::null_behavior_list: return "behavior list must not be null";
        case sbql_errc::null_behavior: return "behavior must not be null";
        case sbql_errc::null_activation_context: return "activation context must not be null";
        case sbql_errc::empty_connection_string: return "connection string must not be null or empty";
        case sbql_errc::empty_queue_name: return "queue name must not be empty";
        case sbql_errc::invalid_shared_access_key: return "shared access key name or key is empty or too long";
        case sbql_errc::already_open: return "listener is already open";
        case sbql_errc::no_endpoint: return "no endpoint detected in connection string";
        case sbql_errc::ambiguous_endpoint: return "more than one endpoint detected in connection string";
        case sbql_errc::malformed_connection_string: return "malformed connection string";
        case sbql_errc::missing_setting: return "configuration setting not found";
        case sbql_errc::decrypt_failed: return "couldn't decrypt configuration setting";
    }
    return "unknown sbql::sbql_category error";
}

error_condition sbql_category::default_error_condition( int value ) const noexcept
{
    switch ( static_cast< sbql_errc >( value ) ) {
        case sbql_errc::null_service_object:
        case sbql_errc::null_binding_policy:
        case sbql_errc::null_behavior_list:
        case sbql_errc::null_behavior:
        case sbql_errc::null_activation_context:
        case sbql_errc::empty_connection_string:
        case sbql_errc::empty_queue_name:
        case sbql_errc::invalid_shared_access_key:
        case sbql_errc::already_open:
            return make_error_condition( sbql_condition::invalid_argument );

        case sbql_errc::no_endpoint:
        case sbql_errc::ambiguous_endpoint:
        case sbql_errc::malformed_connection_string:
        case sbql_errc::missing_setting:
        case sbql_errc::decrypt_failed:
            return make_error_condition( sbql_condition::configuration_error );
    }
    return { value, *this };
}

string sbql_condition_category::message( int value ) const
{
    switch ( static_cast< sbql_condition >( value ) ) {
        case sbql_condition::invalid_argument: return "invalid argument";
        case sbql_condition::configuration_error: return "configuration error";
    }
    return "unknown sbql::sbql_condition_category condition";
}

} // namespace detail

error_category const& sbql_category()
{
    static detail::sbql_category instance;
    return instance;
}

error_category const& sbql_condition_category()
{
    static detail::sbql_condition_category instance;
    return instance;
}


/**
 * function make_error_code, make_error_condition
 */

error_code make_error_code( sbql_errc e )
{
    return { static_cast< int >( e ), sbql_category() };
}

error_condition make_error_condition( sbql_condition e )
{
    return { static_cast< int >( e ), sbql_condition_category() };
}

} // namespace sbql
